#include "protocols/in_memory_lending_market.hpp"
#include "markets/market_registry.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <algorithm>

InMemoryLendingMarket::InMemoryLendingMarket(const MarketRegistry& registry) {
  for (const auto& m : registry.Markets()) books_[m.id] = Book{};
}

InMemoryLendingMarket::Book* InMemoryLendingMarket::FindBook(const std::string& market_id) {
  auto it = books_.find(ToLowerHex(market_id));
  return it == books_.end() ? nullptr : &it->second;
}

bool InMemoryLendingMarket::ShouldFail(const std::string& market_id, LendingOp op) const {
  return failures_.count({ToLowerHex(market_id), op}) > 0;
}

CallResult<LendingPosition> InMemoryLendingMarket::GetPosition(const std::string& market_id, const std::string& account) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ShouldFail(market_id, LendingOp::GET_POSITION)) return CallResult<LendingPosition>::Failure(ExternalErrorKind::UNAVAILABLE, "position");
  Book* book = FindBook(market_id);
  if (!book) return CallResult<LendingPosition>::Failure(ExternalErrorKind::NOT_FOUND, "market " + market_id);
  auto it = book->positions.find(account);
  return CallResult<LendingPosition>::Success(it == book->positions.end() ? LendingPosition{} : it->second);
}

CallResult<LendingMarketState> InMemoryLendingMarket::GetMarketState(const std::string& market_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ShouldFail(market_id, LendingOp::GET_MARKET_STATE)) return CallResult<LendingMarketState>::Failure(ExternalErrorKind::UNAVAILABLE, "market state");
  Book* book = FindBook(market_id);
  if (!book) return CallResult<LendingMarketState>::Failure(ExternalErrorKind::NOT_FOUND, "market " + market_id);
  return CallResult<LendingMarketState>::Success(book->state);
}

CallStatus InMemoryLendingMarket::SupplyCollateral(const std::string& market_id, const std::string& account, u128 amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ShouldFail(market_id, LendingOp::SUPPLY_COLLATERAL)) return CallStatus::Failure(ExternalErrorKind::UNAVAILABLE, "supplyCollateral");
  Book* book = FindBook(market_id);
  if (!book) return CallStatus::Failure(ExternalErrorKind::NOT_FOUND, "market " + market_id);
  if (amount == 0) return CallStatus::Failure(ExternalErrorKind::REJECTED, "zero amount");
  auto& pos = book->positions[account];
  if (pos.collateral > kMaxAmount - amount) return CallStatus::Failure(ExternalErrorKind::REJECTED, "collateral overflow");
  pos.collateral += amount;
  return CallStatus::Success();
}

CallStatus InMemoryLendingMarket::WithdrawCollateral(const std::string& market_id, const std::string& account, u128 amount) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ShouldFail(market_id, LendingOp::WITHDRAW_COLLATERAL)) return CallStatus::Failure(ExternalErrorKind::UNAVAILABLE, "withdrawCollateral");
  Book* book = FindBook(market_id);
  if (!book) return CallStatus::Failure(ExternalErrorKind::NOT_FOUND, "market " + market_id);
  auto it = book->positions.find(account);
  if (amount == 0 || it == book->positions.end() || it->second.collateral < amount) {
    return CallStatus::Failure(ExternalErrorKind::REJECTED, "insufficient collateral");
  }
  it->second.collateral -= amount;
  return CallStatus::Success();
}

CallResult<u128> InMemoryLendingMarket::Borrow(const std::string& market_id, const std::string& account, u128 assets) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ShouldFail(market_id, LendingOp::BORROW)) return CallResult<u128>::Failure(ExternalErrorKind::UNAVAILABLE, "borrow");
  Book* book = FindBook(market_id);
  if (!book) return CallResult<u128>::Failure(ExternalErrorKind::NOT_FOUND, "market " + market_id);
  if (assets == 0) return CallResult<u128>::Failure(ExternalErrorKind::REJECTED, "zero amount");
  auto& st = book->state;
  if (st.total_supply_assets < st.total_borrow_assets || st.total_supply_assets - st.total_borrow_assets < assets) {
    return CallResult<u128>::Failure(ExternalErrorKind::REJECTED, "insufficient liquidity");
  }
  const u128 shares = BorrowAssetsToSharesUp(assets, st);
  book->positions[account].borrow_shares += shares;
  st.total_borrow_shares += shares;
  st.total_borrow_assets += assets;
  return CallResult<u128>::Success(shares);
}

CallResult<RepayReceipt> InMemoryLendingMarket::Repay(const std::string& market_id, const std::string& account, u128 assets) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ShouldFail(market_id, LendingOp::REPAY)) return CallResult<RepayReceipt>::Failure(ExternalErrorKind::UNAVAILABLE, "repay");
  Book* book = FindBook(market_id);
  if (!book) return CallResult<RepayReceipt>::Failure(ExternalErrorKind::NOT_FOUND, "market " + market_id);
  auto it = book->positions.find(account);
  if (assets == 0 || it == book->positions.end() || it->second.borrow_shares == 0) {
    return CallResult<RepayReceipt>::Failure(ExternalErrorKind::REJECTED, "nothing to repay");
  }
  auto& st = book->state;
  auto& pos = it->second;
  const u128 owed = BorrowSharesToAssets(pos.borrow_shares, st);
  RepayReceipt receipt;
  if (assets >= owed) {
    receipt.assets = owed;
    receipt.shares = pos.borrow_shares;
  } else {
    receipt.assets = assets;
    receipt.shares = RepayAssetsToSharesDown(assets, st);
    if (receipt.shares == 0) return CallResult<RepayReceipt>::Failure(ExternalErrorKind::REJECTED, "repay below one share");
  }
  pos.borrow_shares -= receipt.shares;
  st.total_borrow_shares -= receipt.shares;
  st.total_borrow_assets -= std::min(st.total_borrow_assets, receipt.assets);
  return CallResult<RepayReceipt>::Success(receipt);
}

CallResult<u128> InMemoryLendingMarket::RealizeBadDebt(const std::string& market_id, const std::string& account) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ShouldFail(market_id, LendingOp::REALIZE_BAD_DEBT)) return CallResult<u128>::Failure(ExternalErrorKind::UNAVAILABLE, "realizeBadDebt");
  Book* book = FindBook(market_id);
  if (!book) return CallResult<u128>::Failure(ExternalErrorKind::NOT_FOUND, "market " + market_id);
  auto it = book->positions.find(account);
  if (it == book->positions.end() || it->second.borrow_shares == 0) return CallResult<u128>::Success(0);
  if (it->second.collateral != 0) return CallResult<u128>::Failure(ExternalErrorKind::REJECTED, "position still collateralized");
  auto& st = book->state;
  const u128 bad_debt = BorrowSharesToAssets(it->second.borrow_shares, st);
  st.total_borrow_shares -= it->second.borrow_shares;
  st.total_borrow_assets -= std::min(st.total_borrow_assets, bad_debt);
  st.total_supply_assets -= std::min(st.total_supply_assets, bad_debt); // lenders absorb the loss
  it->second.borrow_shares = 0;
  return CallResult<u128>::Success(bad_debt);
}

void InMemoryLendingMarket::SeedLiquidity(const std::string& market_id, u128 assets) {
  std::lock_guard<std::mutex> lock(mutex_);
  Book* book = FindBook(market_id);
  if (!book) throw MarginError(ErrorCode::UNKNOWN_MARKET, market_id);
  book->state.total_supply_assets += assets;
}

void InMemoryLendingMarket::AccrueInterest(const std::string& market_id, u128 assets) {
  std::lock_guard<std::mutex> lock(mutex_);
  Book* book = FindBook(market_id);
  if (!book) throw MarginError(ErrorCode::UNKNOWN_MARKET, market_id);
  if (book->state.total_borrow_shares == 0) return;
  book->state.total_borrow_assets += assets;
  book->state.total_supply_assets += assets;
}

void InMemoryLendingMarket::InjectFailure(const std::string& market_id, LendingOp op) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.insert({ToLowerHex(market_id), op});
}

void InMemoryLendingMarket::ClearFailures() {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.clear();
}
