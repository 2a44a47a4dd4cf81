#pragma once
#include "oracle/price_oracle.hpp"
#include <string>

class RpcClient;

// Reads price() from each market's oracle contract over JSON-RPC.
// The on-chain value is scaled by 1e36 and already folds in the token decimals
// (loan base units per collateral base unit).
class RpcPriceOracle : public PriceOracle {
public:
  RpcPriceOracle(RpcClient& rpc, int timeout_ms);
  CallResult<long double> Price(const MarketConfig& market) override;
  // Raw 1e36-scaled value -> whole loan tokens per whole collateral token
  static long double ScaleRawPrice(long double raw, int collateral_decimals, int loan_decimals);
private:
  RpcClient& rpc_;
  int timeout_ms_;
  std::string selector_;
};
