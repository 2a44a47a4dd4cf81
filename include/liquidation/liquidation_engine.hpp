#pragma once
#include "liquidation/health.hpp"
#include "liquidation/position_aggregator.hpp"
#include <functional>
#include <string>
#include <vector>

class MarketRegistry;
class LendingMarket;
class MarginExchange;
class SubAccountRegistry;
class TokenLedger;
struct SubAccount;

struct RepaidDebt {
  std::string market_id;
  std::string token;
  u128 assets = 0;
  u128 shares = 0;
};

struct SeizedCollateral {
  std::string market_id;
  std::string token;
  u128 amount = 0;           // total seized, including `held`
  u128 held = 0;             // already in the sub-account from an interrupted run
  u128 to_liquidator = 0;
  u128 to_fee_recipient = 0;
};

struct WrittenOffDebt {
  std::string market_id;
  u128 assets = 0;
};

struct LiquidationResult {
  std::string owner;
  std::string sub_account;
  std::string caller;
  HealthStatus health_before;
  std::string equity_token;
  u128 equity_withdrawn = 0;
  std::vector<RepaidDebt> repaid;
  std::vector<SeizedCollateral> seized;
  std::vector<WrittenOffDebt> bad_debt;
  int incentive_bps = 0;

  bool AnyAction() const {
    return equity_withdrawn > 0 || !repaid.empty() || !seized.empty() || !bad_debt.empty();
  }
};

// Evaluates portfolio health and unwinds unhealthy portfolios.
//
// Liquidate runs under the sub-account's lock:
//   1. pull withdrawable exchange funds into the sub-account
//   2. repay debt market by market, in registration order, from those funds
//   3. seize all remaining collateral, plus any the sub-account still holds from
//      an interrupted run, splitting it between caller and fee recipient
//   4. write off debt left with no collateral behind it
// Steps already committed are not rolled back when a later one fails.
class LiquidationEngine {
public:
  using CompletionListener = std::function<void(const LiquidationResult&)>;

  LiquidationEngine(const MarketRegistry& markets,
                    LendingMarket& lending,
                    MarginExchange& exchange,
                    SubAccountRegistry& sub_accounts,
                    TokenLedger& ledger,
                    PositionAggregator& aggregator,
                    RiskParams params);

  // Owners without a sub-account report zero debt (healthy).
  HealthStatus EvaluateHealth(const std::string& owner);
  // Same, but the caller already holds sub.mutex
  HealthStatus EvaluateHealthLocked(const SubAccount& sub);

  // Throws NO_SUB_ACCOUNT, PORTFOLIO_HEALTHY, NOTHING_TO_LIQUIDATE, or an
  // external-dependency MarginError.
  LiquidationResult Liquidate(const std::string& owner, const std::string& caller);

  const RiskParams& Params() const { return params_; }
  void SetCompletionListener(CompletionListener listener) { on_complete_ = std::move(listener); }
private:
  void WithdrawExchangeFunds(const SubAccount& sub, LiquidationResult& r);
  void RepayDebts(const SubAccount& sub, LiquidationResult& r);
  void SeizeCollateral(const SubAccount& sub, const std::string& caller, LiquidationResult& r);
  void RealizeBadDebt(const SubAccount& sub, LiquidationResult& r);
  void EmitHealth(const SubAccount& sub, const HealthStatus& s) const;

  const MarketRegistry& markets_;
  LendingMarket& lending_;
  MarginExchange& exchange_;
  SubAccountRegistry& sub_accounts_;
  TokenLedger& ledger_;
  PositionAggregator& aggregator_;
  RiskParams params_;
  CompletionListener on_complete_;
};
