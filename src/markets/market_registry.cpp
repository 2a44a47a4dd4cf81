#include "markets/market_registry.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

MarketConfig MarketRegistry::AddMarket(MarketConfig cfg) {
  ValidateMarketConfig(cfg);
  cfg.loan_token = ToLowerHex(cfg.loan_token);
  cfg.collateral_token = ToLowerHex(cfg.collateral_token);
  cfg.oracle = ToLowerHex(cfg.oracle);
  cfg.irm = ToLowerHex(cfg.irm);
  cfg.id = DeriveMarketId(cfg.loan_token, cfg.collateral_token, cfg.oracle, cfg.irm, cfg.lltv);
  if (index_.count(cfg.id)) throw MarginError(ErrorCode::DUPLICATE_MARKET, cfg.id);
  index_[cfg.id] = markets_.size();
  markets_.push_back(std::move(cfg));
  const MarketConfig& stored = markets_.back();
  Logger::Info("Market added " + stored.Label() + " id=" + stored.id +
               " cf_bps=" + std::to_string(stored.collateral_factor_bps));
  return stored;
}

const MarketConfig* MarketRegistry::Find(const std::string& id) const {
  auto it = index_.find(ToLowerHex(id));
  if (it == index_.end()) return nullptr;
  return &markets_[it->second];
}

const MarketConfig& MarketRegistry::Get(const std::string& id) const {
  const MarketConfig* m = Find(id);
  if (!m) throw MarginError(ErrorCode::UNKNOWN_MARKET, id);
  return *m;
}

const MarketConfig& MarketRegistry::At(size_t index) const {
  if (index >= markets_.size()) throw MarginError(ErrorCode::UNKNOWN_MARKET, "index " + std::to_string(index));
  return markets_[index];
}

std::string MarketRegistry::PrimaryLoanToken() const {
  for (const auto& m : markets_) if (m.supported) return m.loan_token;
  return std::string();
}

std::optional<int> MarketRegistry::TokenDecimals(const std::string& token) const {
  const std::string t = ToLowerHex(token);
  for (const auto& m : markets_) {
    if (m.loan_token == t) return m.loan_decimals;
    if (m.collateral_token == t) return m.collateral_decimals;
  }
  return std::nullopt;
}

// Numbers above 2^53 must be given as strings to survive JSON.
static unsigned long long ReadUnsigned(const nlohmann::json& j, const char* key) {
  if (!j.contains(key)) throw std::runtime_error(std::string("market entry missing ") + key);
  const auto& v = j.at(key);
  if (v.is_string()) return std::stoull(v.get<std::string>());
  if (v.is_number_unsigned()) return v.get<unsigned long long>();
  if (v.is_number_integer() && v.get<long long>() >= 0) return static_cast<unsigned long long>(v.get<long long>());
  throw std::runtime_error(std::string("market entry field not unsigned: ") + key);
}

MarketRegistry MarketRegistry::LoadFromJson(const std::string& json_text) {
  auto doc = nlohmann::json::parse(json_text);
  if (!doc.contains("markets") || !doc["markets"].is_array()) {
    throw std::runtime_error("market config must contain a \"markets\" array");
  }
  MarketRegistry registry;
  for (const auto& m : doc["markets"]) {
    MarketConfig cfg;
    cfg.loan_token = m.at("loan_token").get<std::string>();
    cfg.collateral_token = m.at("collateral_token").get<std::string>();
    cfg.oracle = m.at("oracle").get<std::string>();
    cfg.irm = m.value("irm", std::string("0x0000000000000000000000000000000000000000"));
    cfg.lltv = ReadUnsigned(m, "lltv");
    cfg.collateral_factor_bps = m.at("collateral_factor_bps").get<int>();
    cfg.collateral_decimals = m.value("collateral_decimals", 18);
    cfg.loan_decimals = m.value("loan_decimals", 6);
    cfg.collateral_symbol = m.value("collateral_symbol", std::string());
    cfg.loan_symbol = m.value("loan_symbol", std::string());
    cfg.supported = m.value("supported", true);
    registry.AddMarket(std::move(cfg));
  }
  return registry;
}

MarketRegistry MarketRegistry::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("cannot open market config: " + path);
  std::stringstream ss;
  ss << in.rdbuf();
  return LoadFromJson(ss.str());
}
