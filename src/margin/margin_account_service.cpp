#include "margin/margin_account_service.hpp"
#include "account/sub_account_registry.hpp"
#include "account/token_ledger.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "liquidation/health.hpp"
#include "liquidation/liquidation_engine.hpp"
#include "liquidation/position_aggregator.hpp"
#include "markets/market_registry.hpp"
#include "protocols/lending_market.hpp"
#include "utils/hex.hpp"
#include <cmath>
#include <mutex>

namespace {

void RequireAmount(u128 amount, const std::string& what) {
  if (amount == 0) throw MarginError(ErrorCode::ZERO_AMOUNT, what);
}

[[noreturn]] void ThrowExternal(const std::string& what, const ExternalCallError& err) {
  throw MarginError(ErrorCode::EXTERNAL_CALL_FAILED, what + ": " + Describe(err));
}

}

MarginAccountService::MarginAccountService(const MarketRegistry& markets,
                                           LendingMarket& lending,
                                           MarginExchange& exchange,
                                           SubAccountRegistry& sub_accounts,
                                           TokenLedger& ledger,
                                           PositionAggregator& aggregator,
                                           LiquidationEngine& engine)
  : markets_(markets), lending_(lending), exchange_(exchange), sub_accounts_(sub_accounts),
    ledger_(ledger), aggregator_(aggregator), engine_(engine) {}

const SubAccount& MarginAccountService::Authorize(const std::string& caller, const std::string& owner) const {
  if (ToLowerHex(caller) != ToLowerHex(owner)) {
    throw MarginError(ErrorCode::UNAUTHORIZED, caller + " is not the owner of " + owner);
  }
  return sub_accounts_.Get(owner);
}

void MarginAccountService::RequireHealthyAfter(const SubAccount& sub, const AggregateValues& v,
                                               long double collateral_delta, long double debt_delta,
                                               long double equity_delta, const std::string& what) const {
  HealthStatus after = ComputeHealth(v.collateral_value + collateral_delta,
                                     v.debt_value + debt_delta,
                                     v.ExternalEquityOrZero() + equity_delta,
                                     engine_.Params().liquidation_threshold);
  if (!after.healthy) {
    throw MarginError(ErrorCode::WOULD_BE_UNHEALTHY,
                      what + " for " + sub.owner + " leaves hf=" + FormatHealthFactor(after.health_factor));
  }
}

std::string MarginAccountService::CreateSubAccount(const std::string& caller) {
  const SubAccount& sub = sub_accounts_.Create(caller);
  return sub.id;
}

void MarginAccountService::DepositCollateral(const std::string& caller, const std::string& owner,
                                             const std::string& market_id, u128 amount) {
  const SubAccount& sub = Authorize(caller, owner);
  const MarketConfig& m = markets_.Get(market_id);
  RequireAmount(amount, "deposit collateral");
  std::lock_guard<std::mutex> lock(sub.mutex);
  ledger_.Debit(sub.owner, m.collateral_token, amount);
  auto st = lending_.SupplyCollateral(m.id, sub.id, amount);
  if (!st.Ok()) {
    ledger_.Credit(sub.owner, m.collateral_token, amount);
    ThrowExternal("supply collateral " + m.Label(), st.Error());
  }
  Logger::Info(sub.owner + " deposited " + AmountToString(amount) + " collateral into " + m.Label());
}

void MarginAccountService::WithdrawCollateral(const std::string& caller, const std::string& owner,
                                              const std::string& market_id, u128 amount) {
  const SubAccount& sub = Authorize(caller, owner);
  const MarketConfig& m = markets_.Get(market_id);
  RequireAmount(amount, "withdraw collateral");
  std::lock_guard<std::mutex> lock(sub.mutex);

  auto pos = lending_.GetPosition(m.id, sub.id);
  if (!pos.Ok()) ThrowExternal("position " + m.Label(), pos.Error());
  if (pos.Value().collateral < amount) {
    throw MarginError(ErrorCode::INSUFFICIENT_COLLATERAL,
                      AmountToString(pos.Value().collateral) + " held in " + m.Label());
  }

  AggregateValues v = aggregator_.AggregateSubAccount(sub.id);
  long double removed = 0.0L;
  if (const MarketExposure* e = v.Exposure(m.id)) {
    removed = static_cast<long double>(amount) / std::pow(10.0L, m.collateral_decimals) * e->price * m.CollateralFactor();
  }
  RequireHealthyAfter(sub, v, -removed, 0.0L, 0.0L, "withdraw collateral");

  auto st = lending_.WithdrawCollateral(m.id, sub.id, amount);
  if (!st.Ok()) ThrowExternal("withdraw collateral " + m.Label(), st.Error());
  ledger_.Credit(sub.owner, m.collateral_token, amount);
  Logger::Info(sub.owner + " withdrew " + AmountToString(amount) + " collateral from " + m.Label());
}

u128 MarginAccountService::Borrow(const std::string& caller, const std::string& owner,
                                  const std::string& market_id, u128 assets) {
  const SubAccount& sub = Authorize(caller, owner);
  const MarketConfig& m = markets_.Get(market_id);
  RequireAmount(assets, "borrow");
  std::lock_guard<std::mutex> lock(sub.mutex);

  AggregateValues v = aggregator_.AggregateSubAccount(sub.id);
  const long double added = static_cast<long double>(assets) / std::pow(10.0L, m.loan_decimals);
  RequireHealthyAfter(sub, v, 0.0L, added, 0.0L, "borrow");

  auto shares = lending_.Borrow(m.id, sub.id, assets);
  if (!shares.Ok()) {
    if (shares.Error().kind == ExternalErrorKind::REJECTED) {
      throw MarginError(ErrorCode::INSUFFICIENT_LIQUIDITY, m.Label() + ": " + Describe(shares.Error()));
    }
    ThrowExternal("borrow " + m.Label(), shares.Error());
  }
  ledger_.Credit(sub.owner, m.loan_token, assets);
  Logger::Info(sub.owner + " borrowed " + AmountToString(assets) + " on " + m.Label());
  return shares.Value();
}

u128 MarginAccountService::Repay(const std::string& caller, const std::string& owner,
                                 const std::string& market_id, u128 assets) {
  const SubAccount& sub = Authorize(caller, owner);
  const MarketConfig& m = markets_.Get(market_id);
  RequireAmount(assets, "repay");
  std::lock_guard<std::mutex> lock(sub.mutex);

  ledger_.Debit(sub.owner, m.loan_token, assets);
  auto receipt = lending_.Repay(m.id, sub.id, assets);
  if (!receipt.Ok()) {
    ledger_.Credit(sub.owner, m.loan_token, assets);
    ThrowExternal("repay " + m.Label(), receipt.Error());
  }
  const u128 taken = receipt.Value().assets;
  if (taken < assets) ledger_.Credit(sub.owner, m.loan_token, assets - taken);
  Logger::Info(sub.owner + " repaid " + AmountToString(taken) + " on " + m.Label());
  return taken;
}

void MarginAccountService::DepositToExchange(const std::string& caller, const std::string& owner,
                                             const std::string& token, u128 amount) {
  const SubAccount& sub = Authorize(caller, owner);
  RequireAmount(amount, "exchange deposit");
  if (IsZeroAddress(token)) throw MarginError(ErrorCode::ZERO_ADDRESS, "exchange token");
  std::lock_guard<std::mutex> lock(sub.mutex);
  ledger_.Debit(sub.owner, token, amount);
  auto st = exchange_.Deposit(sub.id, ToLowerHex(token), amount);
  if (!st.Ok()) {
    ledger_.Credit(sub.owner, token, amount);
    ThrowExternal("exchange deposit", st.Error());
  }
}

void MarginAccountService::WithdrawFromExchange(const std::string& caller, const std::string& owner,
                                                const std::string& token, u128 amount) {
  const SubAccount& sub = Authorize(caller, owner);
  RequireAmount(amount, "exchange withdraw");
  std::lock_guard<std::mutex> lock(sub.mutex);

  auto withdrawable = exchange_.GetWithdrawableAmount(sub.id, ToLowerHex(token));
  if (!withdrawable.Ok()) ThrowExternal("exchange withdrawable", withdrawable.Error());
  if (withdrawable.Value() < amount) {
    throw MarginError(ErrorCode::INSUFFICIENT_BALANCE, "exchange withdrawable " + AmountToString(withdrawable.Value()));
  }

  AggregateValues v = aggregator_.AggregateSubAccount(sub.id);
  const int decimals = markets_.TokenDecimals(token).value_or(6);
  const long double removed = static_cast<long double>(amount) / std::pow(10.0L, decimals);
  RequireHealthyAfter(sub, v, 0.0L, 0.0L, -removed, "exchange withdraw");

  auto st = exchange_.Withdraw(sub.id, ToLowerHex(token), amount);
  if (!st.Ok()) ThrowExternal("exchange withdraw", st.Error());
  ledger_.Credit(sub.owner, token, amount);
}

std::string MarginAccountService::PlaceOrder(const std::string& caller, const std::string& owner, const OrderRequest& order) {
  const SubAccount& sub = Authorize(caller, owner);
  std::lock_guard<std::mutex> lock(sub.mutex);
  auto id = exchange_.PlaceOrder(sub.id, order);
  if (!id.Ok()) ThrowExternal("place order " + order.instrument, id.Error());
  Logger::Info(sub.owner + " placed order " + id.Value() + " on " + order.instrument);
  return id.Value();
}

void MarginAccountService::CancelOrder(const std::string& caller, const std::string& owner, const std::string& order_id) {
  const SubAccount& sub = Authorize(caller, owner);
  std::lock_guard<std::mutex> lock(sub.mutex);
  auto st = exchange_.CancelOrder(sub.id, order_id);
  if (!st.Ok()) ThrowExternal("cancel order " + order_id, st.Error());
}
