#include "oracle/static_price_oracle.hpp"
#include "markets/market_config.hpp"
#include "utils/hex.hpp"

CallResult<long double> StaticPriceOracle::Price(const MarketConfig& market) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_.count(market.id)) return CallResult<long double>::Failure(ExternalErrorKind::UNAVAILABLE, "oracle " + market.oracle);
  auto it = prices_.find(market.id);
  if (it == prices_.end()) return CallResult<long double>::Failure(ExternalErrorKind::NOT_FOUND, "no price for " + market.Label());
  if (!(it->second > 0.0L)) return CallResult<long double>::Failure(ExternalErrorKind::INVALID_RESPONSE, "non-positive price");
  return CallResult<long double>::Success(it->second);
}

void StaticPriceOracle::SetPrice(const std::string& market_id, long double price) {
  std::lock_guard<std::mutex> lock(mutex_);
  prices_[ToLowerHex(market_id)] = price;
}

void StaticPriceOracle::SetUnavailable(const std::string& market_id, bool unavailable) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable) unavailable_.insert(ToLowerHex(market_id));
  else unavailable_.erase(ToLowerHex(market_id));
}
