#pragma once
#include "utils/amount.hpp"
#include <optional>
#include <string>
#include <vector>

class MarketRegistry;
class LendingMarket;
class MarginExchange;
class PriceOracle;
class SubAccountRegistry;

struct MarketExposure {
  std::string market_id;
  std::string label;
  u128 collateral_units = 0;
  u128 borrow_shares = 0;
  u128 debt_units = 0;
  long double price = 0.0L;            // 0 when no collateral (not fetched)
  long double collateral_value = 0.0L; // after collateral factor
  long double debt_value = 0.0L;
};

struct AggregateValues {
  long double collateral_value = 0.0L;
  long double debt_value = 0.0L;
  std::optional<long double> external_equity; // empty: no exchange account
  std::vector<MarketExposure> markets;         // registration order, positions only

  long double ExternalEquityOrZero() const { return external_equity.value_or(0.0L); }
  const MarketExposure* Exposure(const std::string& market_id) const;
};

// Values one account across every supported market and its exchange account.
// Pure read. Any failed oracle or collaborator read fails the whole aggregation
// with a MarginError; partial totals are never returned.
class PositionAggregator {
public:
  PositionAggregator(const MarketRegistry& markets,
                     LendingMarket& lending,
                     MarginExchange& exchange,
                     PriceOracle& oracle,
                     const SubAccountRegistry& sub_accounts);
  // By owner. An owner without a sub-account has nothing to value.
  AggregateValues Aggregate(const std::string& owner);
  // By position-store id
  AggregateValues AggregateSubAccount(const std::string& sub_account_id);
private:
  const MarketRegistry& markets_;
  LendingMarket& lending_;
  MarginExchange& exchange_;
  PriceOracle& oracle_;
  const SubAccountRegistry& sub_accounts_;
};
