#include "liquidation/liquidation_engine.hpp"
#include "account/sub_account_registry.hpp"
#include "account/token_ledger.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "markets/market_registry.hpp"
#include "protocols/lending_market.hpp"
#include "protocols/margin_exchange.hpp"
#include "telemetry/structured_logger.hpp"
#include "utils/hex.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <mutex>
#include <set>

namespace {

[[noreturn]] void ThrowExternal(const std::string& what, const ExternalCallError& err) {
  throw MarginError(ErrorCode::EXTERNAL_CALL_FAILED, what + ": " + Describe(err));
}

nlohmann::json ResultToJson(const LiquidationResult& r) {
  nlohmann::json j;
  j["account"] = r.owner;
  j["sub_account"] = r.sub_account;
  j["caller"] = r.caller;
  j["incentive_bps"] = r.incentive_bps;
  j["equity_withdrawn"] = AmountToString(r.equity_withdrawn);
  auto repaid = nlohmann::json::array();
  for (const auto& d : r.repaid) {
    repaid.push_back({{"market", d.market_id}, {"assets", AmountToString(d.assets)}, {"shares", AmountToString(d.shares)}});
  }
  j["repaid"] = repaid;
  auto seized = nlohmann::json::array();
  for (const auto& s : r.seized) {
    seized.push_back({{"market", s.market_id}, {"token", s.token}, {"amount", AmountToString(s.amount)}, {"held", AmountToString(s.held)},
                      {"liquidator", AmountToString(s.to_liquidator)}, {"fee", AmountToString(s.to_fee_recipient)}});
  }
  j["seized"] = seized;
  auto bad = nlohmann::json::array();
  for (const auto& b : r.bad_debt) bad.push_back({{"market", b.market_id}, {"assets", AmountToString(b.assets)}});
  j["bad_debt"] = bad;
  return j;
}

}

LiquidationEngine::LiquidationEngine(const MarketRegistry& markets,
                                     LendingMarket& lending,
                                     MarginExchange& exchange,
                                     SubAccountRegistry& sub_accounts,
                                     TokenLedger& ledger,
                                     PositionAggregator& aggregator,
                                     RiskParams params)
  : markets_(markets), lending_(lending), exchange_(exchange), sub_accounts_(sub_accounts),
    ledger_(ledger), aggregator_(aggregator), params_(std::move(params)) {
  ValidateRiskParams(params_);
}

HealthStatus LiquidationEngine::EvaluateHealth(const std::string& owner) {
  const SubAccount* sub = sub_accounts_.Find(owner);
  if (!sub) return ComputeHealth(0.0L, 0.0L, 0.0L, params_.liquidation_threshold);
  std::lock_guard<std::mutex> lock(sub->mutex);
  return EvaluateHealthLocked(*sub);
}

HealthStatus LiquidationEngine::EvaluateHealthLocked(const SubAccount& sub) {
  AggregateValues v = aggregator_.AggregateSubAccount(sub.id);
  HealthStatus s = ComputeHealth(v.collateral_value, v.debt_value, v.ExternalEquityOrZero(), params_.liquidation_threshold);
  EmitHealth(sub, s);
  return s;
}

void LiquidationEngine::EmitHealth(const SubAccount& sub, const HealthStatus& s) const {
  nlohmann::json j;
  j["account"] = sub.owner;
  j["collateral_value"] = static_cast<double>(s.collateral_value);
  j["debt_value"] = static_cast<double>(s.debt_value);
  j["external_equity"] = static_cast<double>(s.external_equity);
  j["health_factor"] = FormatHealthFactor(s.health_factor);
  j["healthy"] = s.healthy;
  StructuredLogger::Instance().LogEvent("health_evaluated", std::move(j));
}

LiquidationResult LiquidationEngine::Liquidate(const std::string& owner, const std::string& caller) {
  if (IsZeroAddress(caller)) throw MarginError(ErrorCode::ZERO_ADDRESS, "liquidator");
  const SubAccount* sub = sub_accounts_.Find(owner);
  if (!sub) throw MarginError(ErrorCode::NO_SUB_ACCOUNT, owner);

  std::lock_guard<std::mutex> lock(sub->mutex);
  LiquidationResult r;
  r.owner = sub->owner;
  r.sub_account = sub->id;
  r.caller = ToLowerHex(caller);
  r.incentive_bps = params_.liquidation_incentive_bps;
  r.health_before = EvaluateHealthLocked(*sub);
  if (r.health_before.healthy) {
    throw MarginError(ErrorCode::PORTFOLIO_HEALTHY, owner + " hf=" + FormatHealthFactor(r.health_before.health_factor));
  }
  Logger::Warning("Liquidating " + owner + " hf=" + FormatHealthFactor(r.health_before.health_factor) +
                  " debt=" + std::to_string(static_cast<double>(r.health_before.debt_value)) + " caller=" + r.caller);

  try {
    WithdrawExchangeFunds(*sub, r);
    RepayDebts(*sub, r);
    SeizeCollateral(*sub, r.caller, r);
    RealizeBadDebt(*sub, r);
  } catch (const MarginError& e) {
    if (r.AnyAction()) {
      nlohmann::json j = ResultToJson(r);
      j["error"] = e.what();
      StructuredLogger::Instance().LogEvent("liquidation_partial", std::move(j));
      Logger::Error("Liquidation of " + owner + " stopped part way: " + e.what());
    }
    throw;
  }

  if (!r.AnyAction()) throw MarginError(ErrorCode::NOTHING_TO_LIQUIDATE, owner);

  StructuredLogger::Instance().LogEvent("liquidation_completed", ResultToJson(r));
  Logger::Info("Liquidated " + owner + ": repaid " + std::to_string(r.repaid.size()) + " market(s), seized " +
               std::to_string(r.seized.size()) + ", bad debt " + std::to_string(r.bad_debt.size()));
  if (on_complete_) on_complete_(r);
  return r;
}

void LiquidationEngine::WithdrawExchangeFunds(const SubAccount& sub, LiquidationResult& r) {
  const std::string token = markets_.PrimaryLoanToken();
  if (token.empty()) return;
  auto withdrawable = exchange_.GetWithdrawableAmount(sub.id, token);
  if (!withdrawable.Ok()) {
    if (withdrawable.Error().kind == ExternalErrorKind::NOT_FOUND) return;
    ThrowExternal("exchange withdrawable", withdrawable.Error());
  }
  const u128 amount = withdrawable.Value();
  if (amount == 0) return;
  auto st = exchange_.Withdraw(sub.id, token, amount);
  if (!st.Ok()) ThrowExternal("exchange withdraw", st.Error());
  ledger_.Credit(sub.id, token, amount);
  r.equity_token = token;
  r.equity_withdrawn = amount;
  StructuredLogger::Instance().LogEvent("liquidation_step",
      {{"account", sub.owner}, {"step", "withdraw_equity"}, {"token", token}, {"amount", AmountToString(amount)}});
}

void LiquidationEngine::RepayDebts(const SubAccount& sub, LiquidationResult& r) {
  for (const auto& m : markets_.Markets()) {
    if (!m.supported) continue;
    auto pos = lending_.GetPosition(m.id, sub.id);
    if (!pos.Ok()) ThrowExternal("position " + m.Label(), pos.Error());
    if (pos.Value().borrow_shares == 0) continue;

    const u128 available = ledger_.BalanceOf(sub.id, m.loan_token);
    if (available == 0) continue;
    auto state = lending_.GetMarketState(m.id);
    if (!state.Ok()) ThrowExternal("market state " + m.Label(), state.Error());
    const u128 owed = BorrowSharesToAssets(pos.Value().borrow_shares, state.Value());
    if (owed == 0) continue;
    const u128 amount = std::min(available, owed);
    if (amount < owed && RepayAssetsToSharesDown(amount, state.Value()) == 0) continue; // dust

    auto receipt = lending_.Repay(m.id, sub.id, amount);
    if (!receipt.Ok()) ThrowExternal("repay " + m.Label(), receipt.Error());
    ledger_.Debit(sub.id, m.loan_token, receipt.Value().assets);
    r.repaid.push_back(RepaidDebt{m.id, m.loan_token, receipt.Value().assets, receipt.Value().shares});
    StructuredLogger::Instance().LogEvent("liquidation_step",
        {{"account", sub.owner}, {"step", "repay"}, {"market", m.id},
         {"assets", AmountToString(receipt.Value().assets)}, {"shares", AmountToString(receipt.Value().shares)}});
  }
}

void LiquidationEngine::SeizeCollateral(const SubAccount& sub, const std::string& caller, LiquidationResult& r) {
  std::set<std::string> swept;
  for (const auto& m : markets_.Markets()) {
    if (!m.supported) continue;
    auto pos = lending_.GetPosition(m.id, sub.id);
    if (!pos.Ok()) ThrowExternal("position " + m.Label(), pos.Error());
    const u128 in_market = pos.Value().collateral;
    // Collateral an interrupted liquidation already pulled out of a market
    const bool first_for_token = swept.insert(ToLowerHex(m.collateral_token)).second;
    const u128 held = first_for_token ? ledger_.BalanceOf(sub.id, m.collateral_token) : 0;
    if (in_market == 0 && held == 0) continue;

    if (in_market > 0) {
      auto st = lending_.WithdrawCollateral(m.id, sub.id, in_market);
      if (!st.Ok()) ThrowExternal("withdraw collateral " + m.Label(), st.Error());
      ledger_.Credit(sub.id, m.collateral_token, in_market);
    }
    const u128 amount = in_market + held;
    const u128 incentive = MulDiv(amount, static_cast<u128>(params_.liquidation_incentive_bps), kBpsDenominator, false);
    const u128 to_caller = amount - incentive;

    r.seized.push_back(SeizedCollateral{m.id, m.collateral_token, amount, held, 0, 0});
    SeizedCollateral& rec = r.seized.back();
    if (to_caller > 0) {
      sub_accounts_.TransferOut(sub, sub_accounts_.ManagerId(), m.collateral_token, caller, to_caller);
      rec.to_liquidator = to_caller;
    }
    if (incentive > 0) {
      sub_accounts_.TransferOut(sub, sub_accounts_.ManagerId(), m.collateral_token, params_.fee_recipient, incentive);
      rec.to_fee_recipient = incentive;
    }
    StructuredLogger::Instance().LogEvent("liquidation_step",
        {{"account", sub.owner}, {"step", "seize"}, {"market", m.id}, {"amount", AmountToString(amount)},
         {"held", AmountToString(held)}, {"liquidator", AmountToString(to_caller)}, {"fee", AmountToString(incentive)}});
  }
}

void LiquidationEngine::RealizeBadDebt(const SubAccount& sub, LiquidationResult& r) {
  std::vector<const MarketConfig*> indebted;
  for (const auto& m : markets_.Markets()) {
    if (!m.supported) continue;
    auto pos = lending_.GetPosition(m.id, sub.id);
    if (!pos.Ok()) ThrowExternal("position " + m.Label(), pos.Error());
    if (pos.Value().collateral > 0) return; // debt is still backed somewhere
    if (ledger_.BalanceOf(sub.id, m.collateral_token) > 0) return;
    if (pos.Value().borrow_shares > 0) indebted.push_back(&m);
  }
  for (const MarketConfig* m : indebted) {
    auto written = lending_.RealizeBadDebt(m->id, sub.id);
    if (!written.Ok()) ThrowExternal("bad debt " + m->Label(), written.Error());
    if (written.Value() == 0) continue;
    r.bad_debt.push_back(WrittenOffDebt{m->id, written.Value()});
    Logger::Warning("Bad debt realized on " + m->Label() + " for " + sub.owner + ": " + AmountToString(written.Value()));
    StructuredLogger::Instance().LogEvent("liquidation_step",
        {{"account", sub.owner}, {"step", "bad_debt"}, {"market", m->id}, {"assets", AmountToString(written.Value())}});
  }
}
