#include "protocols/in_memory_margin_exchange.hpp"
#include "utils/hex.hpp"
#include <cmath>

InMemoryMarginExchange::InMemoryMarginExchange(std::unordered_map<std::string, int> token_decimals) {
  for (const auto& kv : token_decimals) token_decimals_[ToLowerHex(kv.first)] = kv.second;
}

void InMemoryMarginExchange::RegisterToken(const std::string& token, int decimals) {
  std::lock_guard<std::mutex> lock(mutex_);
  token_decimals_[ToLowerHex(token)] = decimals;
}

int InMemoryMarginExchange::DecimalsOf(const std::string& token) const {
  auto it = token_decimals_.find(ToLowerHex(token));
  return it == token_decimals_.end() ? 6 : it->second;
}

u128 InMemoryMarginExchange::WithdrawableLocked(const Account& acct, const std::string& token) const {
  auto it = acct.balances.find(ToLowerHex(token));
  if (it == acct.balances.end()) return 0;
  if (acct.unrealized_pnl >= 0.0L) return it->second;
  const long double locked = std::ceil(-acct.unrealized_pnl * std::pow(10.0L, DecimalsOf(token)));
  if (locked >= static_cast<long double>(it->second)) return 0;
  return it->second - static_cast<u128>(locked);
}

CallResult<std::optional<long double>> InMemoryMarginExchange::GetAccountEquity(const std::string& account) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_) return CallResult<std::optional<long double>>::Failure(ExternalErrorKind::UNAVAILABLE, "exchange");
  auto it = accounts_.find(account);
  if (it == accounts_.end()) return CallResult<std::optional<long double>>::Success(std::nullopt);
  long double equity = it->second.unrealized_pnl;
  for (const auto& b : it->second.balances) {
    equity += static_cast<long double>(b.second) / std::pow(10.0L, DecimalsOf(b.first));
  }
  return CallResult<std::optional<long double>>::Success(equity);
}

CallResult<u128> InMemoryMarginExchange::GetWithdrawableAmount(const std::string& account, const std::string& token) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_) return CallResult<u128>::Failure(ExternalErrorKind::UNAVAILABLE, "exchange");
  auto it = accounts_.find(account);
  if (it == accounts_.end()) return CallResult<u128>::Failure(ExternalErrorKind::NOT_FOUND, "account " + account);
  return CallResult<u128>::Success(WithdrawableLocked(it->second, token));
}

CallStatus InMemoryMarginExchange::Withdraw(const std::string& account, const std::string& token, u128 amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_) return CallStatus::Failure(ExternalErrorKind::UNAVAILABLE, "exchange");
  auto it = accounts_.find(account);
  if (it == accounts_.end()) return CallStatus::Failure(ExternalErrorKind::NOT_FOUND, "account " + account);
  if (amount == 0 || WithdrawableLocked(it->second, token) < amount) {
    return CallStatus::Failure(ExternalErrorKind::REJECTED, "amount exceeds withdrawable");
  }
  it->second.balances[ToLowerHex(token)] -= amount;
  return CallStatus::Success();
}

CallStatus InMemoryMarginExchange::Deposit(const std::string& account, const std::string& token, u128 amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_) return CallStatus::Failure(ExternalErrorKind::UNAVAILABLE, "exchange");
  if (amount == 0) return CallStatus::Failure(ExternalErrorKind::REJECTED, "zero amount");
  accounts_[account].balances[ToLowerHex(token)] += amount;
  return CallStatus::Success();
}

CallResult<std::string> InMemoryMarginExchange::PlaceOrder(const std::string& account, const OrderRequest& order) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_) return CallResult<std::string>::Failure(ExternalErrorKind::UNAVAILABLE, "exchange");
  auto it = accounts_.find(account);
  if (it == accounts_.end()) return CallResult<std::string>::Failure(ExternalErrorKind::NOT_FOUND, "account " + account);
  if (order.instrument.empty() || order.size == 0 || order.limit_price == 0) {
    return CallResult<std::string>::Failure(ExternalErrorKind::REJECTED, "invalid order");
  }
  std::string id = "ord-" + std::to_string(next_order_id_++);
  it->second.orders[id] = order;
  return CallResult<std::string>::Success(id);
}

CallStatus InMemoryMarginExchange::CancelOrder(const std::string& account, const std::string& order_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (unavailable_) return CallStatus::Failure(ExternalErrorKind::UNAVAILABLE, "exchange");
  auto it = accounts_.find(account);
  if (it == accounts_.end() || it->second.orders.erase(order_id) == 0) {
    return CallStatus::Failure(ExternalErrorKind::NOT_FOUND, "order " + order_id);
  }
  return CallStatus::Success();
}

void InMemoryMarginExchange::SetUnrealizedPnl(const std::string& account, long double pnl) {
  std::lock_guard<std::mutex> lock(mutex_);
  accounts_[account].unrealized_pnl = pnl;
}

size_t InMemoryMarginExchange::OpenOrderCount(const std::string& account) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(account);
  return it == accounts_.end() ? 0 : it->second.orders.size();
}

void InMemoryMarginExchange::SetUnavailable(bool unavailable) {
  std::lock_guard<std::mutex> lock(mutex_);
  unavailable_ = unavailable;
}
