#include "protocols/lending_market.hpp"

u128 BorrowSharesToAssets(u128 shares, const LendingMarketState& state) {
  if (shares == 0 || state.total_borrow_shares == 0) return 0;
  return MulDiv(shares, state.total_borrow_assets, state.total_borrow_shares, false);
}

u128 BorrowAssetsToSharesUp(u128 assets, const LendingMarketState& state) {
  if (assets == 0) return 0;
  if (state.total_borrow_shares == 0 || state.total_borrow_assets == 0) return assets; // first borrow mints 1:1
  return MulDiv(assets, state.total_borrow_shares, state.total_borrow_assets, true);
}

u128 RepayAssetsToSharesDown(u128 assets, const LendingMarketState& state) {
  if (assets == 0 || state.total_borrow_assets == 0) return 0;
  return MulDiv(assets, state.total_borrow_shares, state.total_borrow_assets, false);
}
