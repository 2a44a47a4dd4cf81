#include "account/sub_account_registry.hpp"
#include "account/token_ledger.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"

SubAccountRegistry::SubAccountRegistry(TokenLedger& ledger, const std::string& manager_id)
  : ledger_(ledger), manager_id_(manager_id) {
  if (manager_id_.empty()) throw MarginError(ErrorCode::ZERO_ADDRESS, "manager id");
}

std::string SubAccountRegistry::DeriveSubAccountId(const std::string& owner) {
  const std::string h = Crypto::Keccak256Raw("portfolio-margin/sub-account/" + ToLowerHex(owner));
  return "0x" + h.substr(h.size() - 40);
}

const SubAccount& SubAccountRegistry::Create(const std::string& owner) {
  if (IsZeroAddress(owner)) throw MarginError(ErrorCode::ZERO_ADDRESS, "owner");
  const std::string key = ToLowerHex(owner);
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (by_owner_.count(key)) throw MarginError(ErrorCode::SUB_ACCOUNT_EXISTS, owner);
  auto sub = std::make_unique<SubAccount>();
  sub->id = DeriveSubAccountId(key);
  sub->owner = key;
  sub->manager = manager_id_;
  const SubAccount& ref = *sub;
  by_owner_.emplace(key, std::move(sub));
  order_.push_back(key);
  Logger::Info("Sub-account " + ref.id + " created for " + key);
  return ref;
}

const SubAccount* SubAccountRegistry::Find(const std::string& owner) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = by_owner_.find(ToLowerHex(owner));
  return it == by_owner_.end() ? nullptr : it->second.get();
}

const SubAccount& SubAccountRegistry::Get(const std::string& owner) const {
  const SubAccount* sub = Find(owner);
  if (!sub) throw MarginError(ErrorCode::NO_SUB_ACCOUNT, owner);
  return *sub;
}

std::vector<std::string> SubAccountRegistry::Owners() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return order_;
}

size_t SubAccountRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return order_.size();
}

void SubAccountRegistry::TransferOut(const SubAccount& sub, const std::string& caller, const std::string& token,
                                     const std::string& to, u128 amount) {
  const std::string who = ToLowerHex(caller);
  if (who != sub.owner && who != ToLowerHex(sub.manager)) {
    throw MarginError(ErrorCode::UNAUTHORIZED, caller + " cannot move funds of " + sub.id);
  }
  if (amount == 0) throw MarginError(ErrorCode::ZERO_AMOUNT, "transfer from " + sub.id);
  ledger_.Transfer(sub.id, to, token, amount);
}

u128 SubAccountRegistry::BalanceOf(const SubAccount& sub, const std::string& token) const {
  return ledger_.BalanceOf(sub.id, token);
}
