#pragma once
#include "protocols/margin_exchange.hpp"
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

// Exchange accounts kept in process. Unrealized PnL is set by the operator
// (or a test); losses reduce what can be withdrawn.
class InMemoryMarginExchange : public MarginExchange {
public:
  // token -> decimals, used to turn balances into equity
  explicit InMemoryMarginExchange(std::unordered_map<std::string, int> token_decimals = {});

  CallResult<std::optional<long double>> GetAccountEquity(const std::string& account) override;
  CallResult<u128> GetWithdrawableAmount(const std::string& account, const std::string& token) override;
  CallStatus Withdraw(const std::string& account, const std::string& token, u128 amount) override;
  CallStatus Deposit(const std::string& account, const std::string& token, u128 amount) override;
  CallResult<std::string> PlaceOrder(const std::string& account, const OrderRequest& order) override;
  CallStatus CancelOrder(const std::string& account, const std::string& order_id) override;

  void RegisterToken(const std::string& token, int decimals);
  void SetUnrealizedPnl(const std::string& account, long double pnl);
  size_t OpenOrderCount(const std::string& account) const;
  void SetUnavailable(bool unavailable);
private:
  struct Account {
    std::map<std::string, u128> balances;
    long double unrealized_pnl = 0.0L;
    std::map<std::string, OrderRequest> orders;
  };
  int DecimalsOf(const std::string& token) const;
  u128 WithdrawableLocked(const Account& acct, const std::string& token) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, int> token_decimals_;
  std::unordered_map<std::string, Account> accounts_;
  unsigned long long next_order_id_ = 1;
  bool unavailable_ = false;
};
