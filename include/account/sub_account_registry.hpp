#pragma once
#include "utils/amount.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

class TokenLedger;

// Per-owner position store. Positions on the lending market and the exchange
// are held under `id`; token balances live in the TokenLedger under `id`.
struct SubAccount {
  std::string id;
  std::string owner;
  std::string manager;
  mutable std::mutex mutex; // serializes every mutation and health decision
};

class SubAccountRegistry {
public:
  SubAccountRegistry(TokenLedger& ledger, const std::string& manager_id);

  // Throws SUB_ACCOUNT_EXISTS or ZERO_ADDRESS
  const SubAccount& Create(const std::string& owner);
  const SubAccount* Find(const std::string& owner) const;
  // Throws NO_SUB_ACCOUNT
  const SubAccount& Get(const std::string& owner) const;
  // Owners in creation order
  std::vector<std::string> Owners() const;
  size_t Size() const;
  const std::string& ManagerId() const { return manager_id_; }

  // Moves tokens out of the sub-account. Only its owner or manager may do this.
  void TransferOut(const SubAccount& sub, const std::string& caller, const std::string& token,
                   const std::string& to, u128 amount);
  u128 BalanceOf(const SubAccount& sub, const std::string& token) const;

  static std::string DeriveSubAccountId(const std::string& owner);
private:
  TokenLedger& ledger_;
  std::string manager_id_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<SubAccount>> by_owner_;
  std::vector<std::string> order_;
};
