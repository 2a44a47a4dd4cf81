#pragma once
#include "oracle/price_oracle.hpp"
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

// Operator-set prices keyed by market id. Unknown markets have no price.
class StaticPriceOracle : public PriceOracle {
public:
  CallResult<long double> Price(const MarketConfig& market) override;
  void SetPrice(const std::string& market_id, long double price);
  void SetUnavailable(const std::string& market_id, bool unavailable);
private:
  std::mutex mutex_;
  std::unordered_map<std::string, long double> prices_;
  std::unordered_set<std::string> unavailable_;
};
