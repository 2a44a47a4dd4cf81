#pragma once
#include "common/call_result.hpp"

struct MarketConfig;

// Price of one whole collateral token expressed in whole loan tokens.
// A successful result is always > 0.
class PriceOracle {
public:
  virtual ~PriceOracle() = default;
  virtual CallResult<long double> Price(const MarketConfig& market) = 0;
};
