#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "common/errors.hpp"

using namespace testing_support;

TEST_CASE("Token ledger balances", "[accounts]") {
  TokenLedger ledger;
  ledger.Credit(kAlice, kUsdc, 100);
  REQUIRE(ledger.BalanceOf(kAlice, kUsdc) == 100);
  REQUIRE(ledger.BalanceOf("0xA11CE00000000000000000000000000000000001", kUsdc) == 100);

  ledger.Transfer(kAlice, kBob, kUsdc, 40);
  REQUIRE(ledger.BalanceOf(kAlice, kUsdc) == 60);
  REQUIRE(ledger.BalanceOf(kBob, kUsdc) == 40);

  try {
    ledger.Debit(kBob, kUsdc, 41);
    FAIL("overdraft accepted");
  } catch (const MarginError& e) {
    REQUIRE(e.Code() == ErrorCode::INSUFFICIENT_BALANCE);
  }
  REQUIRE(ledger.BalanceOf(kBob, kUsdc) == 40);
}

TEST_CASE("Transfers to new holders keep the source balance right", "[accounts]") {
  TokenLedger ledger;
  ledger.Credit(kAlice, kWeth, 1000 * kOneEth);
  // Each transfer inserts a new holder, growing the table through several rehashes
  for (int i = 0; i < 500; ++i) {
    ledger.Transfer(kAlice, "0xholder" + std::to_string(i), kWeth, kOneEth);
  }
  REQUIRE(ledger.BalanceOf(kAlice, kWeth) == 500 * kOneEth);
  REQUIRE(ledger.BalanceOf("0xholder0", kWeth) == kOneEth);
  REQUIRE(ledger.BalanceOf("0xholder499", kWeth) == kOneEth);

  ledger.Transfer(kAlice, kAlice, kWeth, 500 * kOneEth);
  REQUIRE(ledger.BalanceOf(kAlice, kWeth) == 500 * kOneEth);

  ledger.Credit(kBob, kWeth, kMaxAmount);
  REQUIRE_THROWS_AS(ledger.Transfer(kAlice, kBob, kWeth, 1), MarginError);
  REQUIRE(ledger.BalanceOf(kAlice, kWeth) == 500 * kOneEth);
}

TEST_CASE("One sub-account per owner", "[accounts]") {
  TokenLedger ledger;
  SubAccountRegistry subs(ledger, kEngine);
  const SubAccount& a = subs.Create(kAlice);
  REQUIRE(a.owner == kAlice);
  REQUIRE(a.manager == kEngine);
  REQUIRE(a.id == SubAccountRegistry::DeriveSubAccountId(kAlice));
  REQUIRE(a.id.size() == 42);
  REQUIRE(a.id != SubAccountRegistry::DeriveSubAccountId(kBob));

  REQUIRE_THROWS_AS(subs.Create(kAlice), MarginError);
  REQUIRE_THROWS_AS(subs.Create("0x0000000000000000000000000000000000000000"), MarginError);
  REQUIRE(subs.Find(kBob) == nullptr);
  REQUIRE_THROWS_AS(subs.Get(kBob), MarginError);

  subs.Create(kBob);
  REQUIRE(subs.Size() == 2);
  REQUIRE(subs.Owners() == std::vector<std::string>{kAlice, kBob});
}

TEST_CASE("Only owner or manager move sub-account funds", "[accounts]") {
  TokenLedger ledger;
  SubAccountRegistry subs(ledger, kEngine);
  const SubAccount& a = subs.Create(kAlice);
  ledger.Credit(a.id, kWeth, 10);

  try {
    subs.TransferOut(a, kBob, kWeth, kBob, 5);
    FAIL("stranger moved funds");
  } catch (const MarginError& e) {
    REQUIRE(e.Code() == ErrorCode::UNAUTHORIZED);
    REQUIRE(e.Category() == ErrorCategory::AUTHORIZATION);
  }
  subs.TransferOut(a, kEngine, kWeth, kLiquidator, 4);
  subs.TransferOut(a, kAlice, kWeth, kAlice, 6);
  REQUIRE(subs.BalanceOf(a, kWeth) == 0);
  REQUIRE(ledger.BalanceOf(kLiquidator, kWeth) == 4);
  REQUIRE_THROWS_AS(subs.TransferOut(a, kAlice, kWeth, kAlice, 0), MarginError);
}
