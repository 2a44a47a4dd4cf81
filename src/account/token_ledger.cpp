#include "account/token_ledger.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"

std::string TokenLedger::Key(const std::string& holder, const std::string& token) {
  return ToLowerHex(holder) + "|" + ToLowerHex(token);
}

u128 TokenLedger::BalanceOf(const std::string& holder, const std::string& token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = balances_.find(Key(holder, token));
  return it == balances_.end() ? 0 : it->second;
}

void TokenLedger::Credit(const std::string& holder, const std::string& token, u128 amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& bal = balances_[Key(holder, token)];
  if (bal > kMaxAmount - amount) throw MarginError(ErrorCode::INSUFFICIENT_BALANCE, "balance overflow for " + holder);
  bal += amount;
}

void TokenLedger::Debit(const std::string& holder, const std::string& token, u128 amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = balances_.find(Key(holder, token));
  if (it == balances_.end() || it->second < amount) {
    throw MarginError(ErrorCode::INSUFFICIENT_BALANCE, holder + " holds less than " + AmountToString(amount) + " of " + token);
  }
  it->second -= amount;
}

void TokenLedger::Transfer(const std::string& from, const std::string& to, const std::string& token, u128 amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = balances_.find(Key(from, token));
  if (it == balances_.end() || it->second < amount) {
    throw MarginError(ErrorCode::INSUFFICIENT_BALANCE, from + " holds less than " + AmountToString(amount) + " of " + token);
  }
  // References survive the rehash an insert of `to` may cause; iterators do not
  u128& src = it->second;
  u128& dst = balances_[Key(to, token)];
  if (&src != &dst && dst > kMaxAmount - amount) throw MarginError(ErrorCode::INSUFFICIENT_BALANCE, "balance overflow for " + to);
  src -= amount;
  dst += amount;
}
