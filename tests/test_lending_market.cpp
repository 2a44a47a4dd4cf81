#include <catch2/catch.hpp>
#include "test_support.hpp"
#include <stdexcept>

using namespace testing_support;

TEST_CASE("Share conversions round against the borrower", "[lending]") {
  LendingMarketState st;
  st.total_borrow_assets = 2;
  st.total_borrow_shares = 3;
  REQUIRE(BorrowSharesToAssets(1, st) == 0);
  REQUIRE(BorrowSharesToAssets(3, st) == 2);
  REQUIRE(BorrowAssetsToSharesUp(1, st) == 2);
  REQUIRE(RepayAssetsToSharesDown(1, st) == 1);

  SECTION("empty market mints one share per asset") {
    LendingMarketState empty;
    REQUIRE(BorrowAssetsToSharesUp(500, empty) == 500);
    REQUIRE(BorrowSharesToAssets(500, empty) == 0);
  }
  SECTION("products wider than 64 bits do not overflow") {
    LendingMarketState big;
    big.total_borrow_assets = 9000000000000000000ULL;
    big.total_borrow_shares = 9000000000000000000ULL;
    REQUIRE(BorrowSharesToAssets(8000000000000000000ULL, big) == 8000000000000000000ULL);
  }
  SECTION("products wider than 128 bits do not overflow") {
    const u128 e30 = static_cast<u128>(1000000000000000ULL) * 1000000000000000ULL;
    LendingMarketState huge;
    huge.total_borrow_assets = 3 * e30;
    huge.total_borrow_shares = 2 * e30;
    REQUIRE(BorrowSharesToAssets(e30, huge) == 3 * e30 / 2);
    REQUIRE(BorrowAssetsToSharesUp(3 * e30 / 2, huge) == e30);
    REQUIRE(RepayAssetsToSharesDown(3 * e30, huge) == 2 * e30);
  }
}

TEST_CASE("Wide multiply-divide", "[lending]") {
  const u128 two100 = static_cast<u128>(1) << 100;
  REQUIRE(MulDiv(two100, two100, static_cast<u128>(1) << 90, false) == (static_cast<u128>(1) << 110));
  // (2^128 - 1) * 3 = 4 * (3 * 2^126 - 1) + 1
  const u128 floor_q = 3 * (static_cast<u128>(1) << 126) - 1;
  REQUIRE(MulDiv(kMaxAmount, 3, 4, false) == floor_q);
  REQUIRE(MulDiv(kMaxAmount, 3, 4, true) == floor_q + 1);
  REQUIRE(MulDiv(kMaxAmount, kMaxAmount, 1, false) == kMaxAmount);
  REQUIRE(MulDiv(7, 5, 3, false) == 11);
  REQUIRE(MulDiv(7, 5, 3, true) == 12);
  REQUIRE_THROWS(MulDiv(1, 1, 0, false));
}

TEST_CASE("Amounts render and parse as decimal strings", "[lending]") {
  REQUIRE(AmountToString(0) == "0");
  REQUIRE(AmountToString(25 * kOneEth) == "25000000000000000000");
  REQUIRE(AmountToString(kMaxAmount) == "340282366920938463463374607431768211455");
  REQUIRE(ParseAmount("340282366920938463463374607431768211455") == kMaxAmount);
  REQUIRE(ParseAmount("25000000000000000000") == 25 * kOneEth);
  REQUIRE_THROWS_AS(ParseAmount("340282366920938463463374607431768211456"), std::out_of_range);
  REQUIRE_THROWS_AS(ParseAmount("-1"), std::invalid_argument);
  REQUIRE_THROWS_AS(ParseAmount(""), std::invalid_argument);
}

TEST_CASE("In-memory lending book", "[lending]") {
  MarketRegistry markets;
  const std::string id = markets.AddMarket(WethMarket()).id;
  InMemoryLendingMarket lending(markets);
  const std::string acct = "0xacc0000000000000000000000000000000000001";

  SECTION("unknown markets are not found") {
    auto pos = lending.GetPosition("0xdead", acct);
    REQUIRE_FALSE(pos.Ok());
    REQUIRE(pos.Error().kind == ExternalErrorKind::NOT_FOUND);
  }
  SECTION("borrowing needs liquidity") {
    REQUIRE(lending.SupplyCollateral(id, acct, kOneEth).Ok());
    auto b = lending.Borrow(id, acct, 100 * kOneUsdc);
    REQUIRE_FALSE(b.Ok());
    REQUIRE(b.Error().kind == ExternalErrorKind::REJECTED);

    lending.SeedLiquidity(id, 100 * kOneUsdc);
    b = lending.Borrow(id, acct, 100 * kOneUsdc);
    REQUIRE(b.Ok());
    REQUIRE(b.Value() == 100 * kOneUsdc);
    REQUIRE(lending.GetMarketState(id).Value().total_borrow_assets == 100 * kOneUsdc);
  }
  SECTION("repay never takes more than owed") {
    lending.SeedLiquidity(id, 1000 * kOneUsdc);
    REQUIRE(lending.Borrow(id, acct, 100 * kOneUsdc).Ok());
    auto partial = lending.Repay(id, acct, 40 * kOneUsdc);
    REQUIRE(partial.Ok());
    REQUIRE(partial.Value().assets == 40 * kOneUsdc);
    auto rest = lending.Repay(id, acct, 1000 * kOneUsdc);
    REQUIRE(rest.Ok());
    REQUIRE(rest.Value().assets == 60 * kOneUsdc);
    REQUIRE(lending.GetPosition(id, acct).Value().borrow_shares == 0);
    REQUIRE_FALSE(lending.Repay(id, acct, 1).Ok());
  }
  SECTION("bad debt needs an empty collateral balance") {
    lending.SeedLiquidity(id, 1000 * kOneUsdc);
    REQUIRE(lending.SupplyCollateral(id, acct, kOneEth).Ok());
    REQUIRE(lending.Borrow(id, acct, 100 * kOneUsdc).Ok());
    REQUIRE_FALSE(lending.RealizeBadDebt(id, acct).Ok());

    REQUIRE(lending.WithdrawCollateral(id, acct, kOneEth).Ok());
    auto written = lending.RealizeBadDebt(id, acct);
    REQUIRE(written.Ok());
    REQUIRE(written.Value() == 100 * kOneUsdc);
    auto st = lending.GetMarketState(id).Value();
    REQUIRE(st.total_borrow_assets == 0);
    REQUIRE(st.total_supply_assets == 900 * kOneUsdc);
    REQUIRE(lending.RealizeBadDebt(id, acct).Value() == 0);
  }
  SECTION("injected failures persist until cleared") {
    lending.InjectFailure(id, LendingOp::GET_MARKET_STATE);
    REQUIRE(lending.GetMarketState(id).Error().kind == ExternalErrorKind::UNAVAILABLE);
    REQUIRE(lending.GetMarketState(id).Error().kind == ExternalErrorKind::UNAVAILABLE);
    REQUIRE(lending.GetPosition(id, acct).Ok());
    lending.ClearFailures();
    REQUIRE(lending.GetMarketState(id).Ok());
  }
}
