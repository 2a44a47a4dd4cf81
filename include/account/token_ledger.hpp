#pragma once
#include "utils/amount.hpp"
#include <mutex>
#include <string>
#include <unordered_map>

// Token balances held by the service: owner wallets, sub-accounts,
// liquidators and the fee recipient.
class TokenLedger {
public:
  u128 BalanceOf(const std::string& holder, const std::string& token) const;
  void Credit(const std::string& holder, const std::string& token, u128 amount);
  // Throws MarginError(INSUFFICIENT_BALANCE)
  void Debit(const std::string& holder, const std::string& token, u128 amount);
  void Transfer(const std::string& from, const std::string& to, const std::string& token, u128 amount);
private:
  static std::string Key(const std::string& holder, const std::string& token);
  mutable std::mutex mutex_;
  std::unordered_map<std::string, u128> balances_;
};
