#pragma once
#include "protocols/lending_market.hpp"
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

class MarketRegistry;

enum class LendingOp {
  GET_POSITION, GET_MARKET_STATE, SUPPLY_COLLATERAL, WITHDRAW_COLLATERAL, BORROW, REPAY, REALIZE_BAD_DEBT
};

// Lending book kept by the service itself. One book per registered market.
class InMemoryLendingMarket : public LendingMarket {
public:
  explicit InMemoryLendingMarket(const MarketRegistry& registry);

  CallResult<LendingPosition> GetPosition(const std::string& market_id, const std::string& account) override;
  CallResult<LendingMarketState> GetMarketState(const std::string& market_id) override;
  CallStatus SupplyCollateral(const std::string& market_id, const std::string& account, u128 amount) override;
  CallStatus WithdrawCollateral(const std::string& market_id, const std::string& account, u128 amount) override;
  CallResult<u128> Borrow(const std::string& market_id, const std::string& account, u128 assets) override;
  CallResult<RepayReceipt> Repay(const std::string& market_id, const std::string& account, u128 assets) override;
  CallResult<u128> RealizeBadDebt(const std::string& market_id, const std::string& account) override;

  // Lender side, outside the collaborator contract
  void SeedLiquidity(const std::string& market_id, u128 assets);
  void AccrueInterest(const std::string& market_id, u128 assets);

  // Makes every later call of `op` on the market fail with UNAVAILABLE
  void InjectFailure(const std::string& market_id, LendingOp op);
  void ClearFailures();
private:
  struct Book {
    LendingMarketState state;
    std::unordered_map<std::string, LendingPosition> positions;
  };
  Book* FindBook(const std::string& market_id);
  bool ShouldFail(const std::string& market_id, LendingOp op) const;

  std::mutex mutex_;
  std::unordered_map<std::string, Book> books_;
  std::set<std::pair<std::string, LendingOp>> failures_;
};
