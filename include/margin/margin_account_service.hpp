#pragma once
#include "protocols/margin_exchange.hpp"
#include <string>

class MarketRegistry;
class LendingMarket;
class SubAccountRegistry;
class TokenLedger;
class PositionAggregator;
class LiquidationEngine;
struct SubAccount;
struct AggregateValues;

// Owner-facing operations on a sub-account. The service acts as the
// sub-account's manager; every call must come from the owner. Mutations run
// under the sub-account's lock, and the ones that can weaken the portfolio are
// checked against the liquidation threshold before anything moves.
class MarginAccountService {
public:
  MarginAccountService(const MarketRegistry& markets,
                       LendingMarket& lending,
                       MarginExchange& exchange,
                       SubAccountRegistry& sub_accounts,
                       TokenLedger& ledger,
                       PositionAggregator& aggregator,
                       LiquidationEngine& engine);

  // Returns the new sub-account id
  std::string CreateSubAccount(const std::string& caller);

  // Collateral moves between the owner's wallet and the lending market
  void DepositCollateral(const std::string& caller, const std::string& owner, const std::string& market_id, u128 amount);
  void WithdrawCollateral(const std::string& caller, const std::string& owner, const std::string& market_id, u128 amount);
  // Proceeds are paid to the owner's wallet. Returns borrow shares minted.
  u128 Borrow(const std::string& caller, const std::string& owner, const std::string& market_id, u128 assets);
  // Takes at most the debt owed from the owner's wallet. Returns assets repaid.
  u128 Repay(const std::string& caller, const std::string& owner, const std::string& market_id, u128 assets);

  void DepositToExchange(const std::string& caller, const std::string& owner, const std::string& token, u128 amount);
  void WithdrawFromExchange(const std::string& caller, const std::string& owner, const std::string& token, u128 amount);
  std::string PlaceOrder(const std::string& caller, const std::string& owner, const OrderRequest& order);
  void CancelOrder(const std::string& caller, const std::string& owner, const std::string& order_id);
private:
  const SubAccount& Authorize(const std::string& caller, const std::string& owner) const;
  // Throws WOULD_BE_UNHEALTHY if the adjusted portfolio fails the threshold
  void RequireHealthyAfter(const SubAccount& sub, const AggregateValues& v,
                           long double collateral_delta, long double debt_delta, long double equity_delta,
                           const std::string& what) const;

  const MarketRegistry& markets_;
  LendingMarket& lending_;
  MarginExchange& exchange_;
  SubAccountRegistry& sub_accounts_;
  TokenLedger& ledger_;
  PositionAggregator& aggregator_;
  LiquidationEngine& engine_;
};
