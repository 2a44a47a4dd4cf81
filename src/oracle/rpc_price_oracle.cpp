#include "oracle/rpc_price_oracle.hpp"
#include "markets/market_config.hpp"
#include "node_connection/rpc_client.hpp"
#include "crypto/keccak.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <cmath>

RpcPriceOracle::RpcPriceOracle(RpcClient& rpc, int timeout_ms)
  : rpc_(rpc), timeout_ms_(timeout_ms), selector_(Crypto::FunctionSelector("price()")) {}

long double RpcPriceOracle::ScaleRawPrice(long double raw, int collateral_decimals, int loan_decimals) {
  return raw / std::pow(10.0L, 36 + loan_decimals - collateral_decimals);
}

CallResult<long double> RpcPriceOracle::Price(const MarketConfig& market) {
  std::string result;
  try {
    result = rpc_.EthCall(market.oracle, selector_, std::nullopt, timeout_ms_);
  } catch (const RpcError& e) {
    Logger::Warning("Oracle call failed for " + market.Label() + ": " + e.what());
    return CallResult<long double>::Failure(e.TimedOut() ? ExternalErrorKind::TIMEOUT : ExternalErrorKind::UNAVAILABLE, e.what());
  } catch (const std::exception& e) {
    Logger::Warning("Oracle response unreadable for " + market.Label() + ": " + e.what());
    return CallResult<long double>::Failure(ExternalErrorKind::INVALID_RESPONSE, e.what());
  }
  const std::string word = Strip0x(result);
  if (word.empty() || word.size() > 64 || !IsHexString(word)) {
    return CallResult<long double>::Failure(ExternalErrorKind::INVALID_RESPONSE, "price() returned " + result);
  }
  const long double raw = HexToLongDouble(word);
  if (!(raw > 0.0L)) return CallResult<long double>::Failure(ExternalErrorKind::INVALID_RESPONSE, "non-positive price");
  return CallResult<long double>::Success(ScaleRawPrice(raw, market.collateral_decimals, market.loan_decimals));
}
