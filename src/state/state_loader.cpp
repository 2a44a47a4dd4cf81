#include "state/state_loader.hpp"
#include "account/token_ledger.hpp"
#include "common/logger.hpp"
#include "margin/margin_account_service.hpp"
#include "markets/market_registry.hpp"
#include "oracle/static_price_oracle.hpp"
#include "protocols/in_memory_lending_market.hpp"
#include "protocols/in_memory_margin_exchange.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {

const MarketConfig& ResolveMarket(const MarketRegistry& markets, const nlohmann::json& ref) {
  if (ref.is_number_unsigned() || ref.is_number_integer()) {
    const long long index = ref.get<long long>();
    if (index < 0 || static_cast<size_t>(index) >= markets.Size()) {
      throw std::runtime_error("state references market index " + std::to_string(index));
    }
    return markets.At(static_cast<size_t>(index));
  }
  if (ref.is_string()) return markets.Get(ref.get<std::string>());
  throw std::runtime_error("state market reference must be an index or an id");
}

u128 ReadAmount(const nlohmann::json& entry) {
  const auto& v = entry.at("amount");
  if (v.is_string()) return ParseAmount(v.get<std::string>());
  if (v.is_number_unsigned()) return v.get<unsigned long long>();
  if (v.is_number_integer() && v.get<long long>() >= 0) return static_cast<u128>(v.get<long long>());
  throw std::runtime_error("state amount must be a non-negative integer");
}

void ApplyAccount(const nlohmann::json& acct, StateTargets& t) {
  const std::string owner = acct.at("owner").get<std::string>();
  const std::string sub_id = t.accounts.CreateSubAccount(owner);

  for (const auto& w : acct.value("wallet", nlohmann::json::array())) {
    t.ledger.Credit(owner, w.at("token").get<std::string>(), ReadAmount(w));
  }
  for (const auto& c : acct.value("collateral", nlohmann::json::array())) {
    const MarketConfig& m = ResolveMarket(t.markets, c.at("market"));
    const u128 amount = ReadAmount(c);
    t.ledger.Credit(owner, m.collateral_token, amount);
    t.accounts.DepositCollateral(owner, owner, m.id, amount);
  }
  if (acct.contains("exchange")) {
    const auto& ex = acct["exchange"];
    for (const auto& d : ex.value("deposits", nlohmann::json::array())) {
      const std::string token = d.at("token").get<std::string>();
      const u128 amount = ReadAmount(d);
      t.ledger.Credit(owner, token, amount);
      t.accounts.DepositToExchange(owner, owner, token, amount);
    }
    if (ex.contains("unrealized_pnl") && t.exchange) {
      t.exchange->SetUnrealizedPnl(sub_id, ex["unrealized_pnl"].get<double>());
    }
  }
  for (const auto& b : acct.value("borrow", nlohmann::json::array())) {
    const MarketConfig& m = ResolveMarket(t.markets, b.at("market"));
    t.accounts.Borrow(owner, owner, m.id, ReadAmount(b));
  }
}

}

StateSummary StateLoader::ApplyJson(const std::string& json_text, StateTargets& t) {
  auto doc = nlohmann::json::parse(json_text);
  StateSummary summary;

  if (t.lending) {
    for (const auto& l : doc.value("liquidity", nlohmann::json::array())) {
      t.lending->SeedLiquidity(ResolveMarket(t.markets, l.at("market")).id, ReadAmount(l));
      ++summary.markets_seeded;
    }
  }
  if (t.prices) {
    for (const auto& p : doc.value("prices", nlohmann::json::array())) {
      t.prices->SetPrice(ResolveMarket(t.markets, p.at("market")).id, p.at("price").get<double>());
      ++summary.prices;
    }
  }
  for (const auto& acct : doc.value("accounts", nlohmann::json::array())) {
    ApplyAccount(acct, t);
    ++summary.accounts;
  }
  if (t.lending) {
    for (const auto& i : doc.value("interest", nlohmann::json::array())) {
      t.lending->AccrueInterest(ResolveMarket(t.markets, i.at("market")).id, ReadAmount(i));
    }
  }
  Logger::Info("State applied: " + std::to_string(summary.accounts) + " account(s), " +
               std::to_string(summary.prices) + " price(s), " + std::to_string(summary.markets_seeded) + " liquidity seed(s)");
  return summary;
}

StateSummary StateLoader::ApplyFile(const std::string& path, StateTargets& t) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("cannot open state file: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ApplyJson(ss.str(), t);
}
