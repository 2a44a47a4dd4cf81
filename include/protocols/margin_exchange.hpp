#pragma once
#include "common/call_result.hpp"
#include "utils/amount.hpp"
#include <optional>
#include <string>

enum class OrderSide { BUY, SELL };

struct OrderRequest {
  std::string instrument;       // e.g. "BTC-PERP"
  OrderSide side = OrderSide::BUY;
  unsigned long long size = 0;  // contract units
  unsigned long long limit_price = 0;
  bool reduce_only = false;
};

// Perpetuals exchange holding the account's external margin.
// Equity is signed and expressed in loan-token (USD) units.
class MarginExchange {
public:
  virtual ~MarginExchange() = default;
  // Empty optional: the account does not exist on the exchange
  virtual CallResult<std::optional<long double>> GetAccountEquity(const std::string& account) = 0;
  virtual CallResult<u128> GetWithdrawableAmount(const std::string& account, const std::string& token) = 0;
  virtual CallStatus Withdraw(const std::string& account, const std::string& token, u128 amount) = 0;
  virtual CallStatus Deposit(const std::string& account, const std::string& token, u128 amount) = 0;
  // Returns the exchange order id
  virtual CallResult<std::string> PlaceOrder(const std::string& account, const OrderRequest& order) = 0;
  virtual CallStatus CancelOrder(const std::string& account, const std::string& order_id) = 0;
};
