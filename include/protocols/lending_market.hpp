#pragma once
#include "common/call_result.hpp"
#include "utils/amount.hpp"
#include <string>

struct LendingPosition {
  u128 collateral = 0;
  u128 borrow_shares = 0;
};

struct LendingMarketState {
  u128 total_supply_assets = 0;
  u128 total_borrow_assets = 0;
  u128 total_borrow_shares = 0;
};

struct RepayReceipt {
  u128 assets = 0;
  u128 shares = 0;
};

// Debt owed for a share count. Rounds down.
u128 BorrowSharesToAssets(u128 shares, const LendingMarketState& state);
// Shares minted for a borrow. Rounds up so the borrower never owes less than taken.
u128 BorrowAssetsToSharesUp(u128 assets, const LendingMarketState& state);
// Shares burned for a repayment. Rounds down.
u128 RepayAssetsToSharesDown(u128 assets, const LendingMarketState& state);

// Lending collaborator. Positions are keyed by (market id, account).
// Interest accrual and share accounting are owned by the implementation.
class LendingMarket {
public:
  virtual ~LendingMarket() = default;
  virtual CallResult<LendingPosition> GetPosition(const std::string& market_id, const std::string& account) = 0;
  virtual CallResult<LendingMarketState> GetMarketState(const std::string& market_id) = 0;
  virtual CallStatus SupplyCollateral(const std::string& market_id, const std::string& account, u128 amount) = 0;
  virtual CallStatus WithdrawCollateral(const std::string& market_id, const std::string& account, u128 amount) = 0;
  // Returns the borrow shares minted
  virtual CallResult<u128> Borrow(const std::string& market_id, const std::string& account, u128 assets) = 0;
  // Repays up to `assets`; never takes more than the debt owed
  virtual CallResult<RepayReceipt> Repay(const std::string& market_id, const std::string& account, u128 assets) = 0;
  // Writes off the account's remaining debt in the market. Returns assets written off.
  virtual CallResult<u128> RealizeBadDebt(const std::string& market_id, const std::string& account) = 0;
};
