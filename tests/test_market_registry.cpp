#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "common/errors.hpp"
#include "crypto/keccak.hpp"

using namespace testing_support;

namespace {

ErrorCode AddFails(MarketRegistry& r, const MarketConfig& cfg) {
  try {
    r.AddMarket(cfg);
  } catch (const MarginError& e) {
    return e.Code();
  }
  FAIL("market was accepted");
  return ErrorCode::EXTERNAL_CALL_FAILED;
}

}

TEST_CASE("Function selectors match the Solidity ABI", "[crypto]") {
  REQUIRE(Crypto::FunctionSelector("price()") == "0xa035b1fe");
  REQUIRE(Crypto::FunctionSelector("transfer(address,uint256)") == "0xa9059cbb");
  REQUIRE(Crypto::Keccak256Raw("") == "0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST_CASE("Market ids are derived from the market parameters", "[markets]") {
  MarketRegistry r;
  MarketConfig stored = r.AddMarket(WethMarket());
  REQUIRE(stored.id.size() == 66);
  REQUIRE(stored.id.rfind("0x", 0) == 0);
  REQUIRE(stored.id == DeriveMarketId(kUsdc, kWeth, kWethOracle, kIrm, 770000000000000000ULL));

  SECTION("any parameter changes the id") {
    REQUIRE(stored.id != DeriveMarketId(kUsdc, kWeth, kWethOracle, kIrm, 860000000000000000ULL));
    REQUIRE(stored.id != DeriveMarketId(kUsdc, kWbtc, kWethOracle, kIrm, 770000000000000000ULL));
  }
  SECTION("address case does not matter") {
    REQUIRE(DeriveMarketId("0xABCDEF0000000000000000000000000000000001", kWeth, kWethOracle, kIrm, 1) ==
            DeriveMarketId("0xabcdef0000000000000000000000000000000001", kWeth, kWethOracle, kIrm, 1));
  }
  SECTION("the same market cannot be added twice") {
    REQUIRE(AddFails(r, WethMarket()) == ErrorCode::DUPLICATE_MARKET);
    REQUIRE(r.Size() == 1);
  }
}

TEST_CASE("Invalid markets are rejected at registration", "[markets][config]") {
  MarketRegistry r;

  MarketConfig cf = WethMarket();
  cf.collateral_factor_bps = 10001;
  REQUIRE(AddFails(r, cf) == ErrorCode::INVALID_COLLATERAL_FACTOR);

  MarketConfig lltv_zero = WethMarket();
  lltv_zero.lltv = 0;
  REQUIRE(AddFails(r, lltv_zero) == ErrorCode::INVALID_LLTV);

  MarketConfig lltv_high = WethMarket();
  lltv_high.lltv = kWad + 1;
  REQUIRE(AddFails(r, lltv_high) == ErrorCode::INVALID_LLTV);

  MarketConfig decimals = WethMarket();
  decimals.collateral_decimals = 37;
  REQUIRE(AddFails(r, decimals) == ErrorCode::INVALID_DECIMALS);

  MarketConfig zero_loan = WethMarket();
  zero_loan.loan_token = "0x0000000000000000000000000000000000000000";
  REQUIRE(AddFails(r, zero_loan) == ErrorCode::ZERO_ADDRESS);

  MarketConfig no_oracle = WethMarket();
  no_oracle.oracle = "";
  REQUIRE(AddFails(r, no_oracle) == ErrorCode::ZERO_ADDRESS);

  REQUIRE(r.Empty());

  MarketConfig full = WethMarket();
  full.collateral_factor_bps = 10000;
  full.lltv = kWad;
  REQUIRE_NOTHROW(r.AddMarket(full));
}

TEST_CASE("Registration order is iteration order", "[markets]") {
  MarketRegistry r;
  MarketConfig btc = r.AddMarket(WbtcMarket());
  MarketConfig eth = r.AddMarket(WethMarket());
  REQUIRE(r.Size() == 2);
  REQUIRE(r.Markets()[0].id == btc.id);
  REQUIRE(r.Markets()[1].id == eth.id);
  REQUIRE(r.At(1).id == eth.id);
  REQUIRE(r.Get(eth.id).collateral_symbol == "WETH");
  REQUIRE(r.Find("0xdead") == nullptr);
  REQUIRE_THROWS_AS(r.Get("0xdead"), MarginError);
  REQUIRE(r.PrimaryLoanToken() == kUsdc);
  REQUIRE(*r.TokenDecimals(kWbtc) == 8);
  REQUIRE_FALSE(r.TokenDecimals("0x9999").has_value());
}

TEST_CASE("Markets load from JSON", "[markets][config]") {
  const std::string doc = R"({
    "markets": [
      {"loan_token": "0x1000000000000000000000000000000000000001",
       "collateral_token": "0x2000000000000000000000000000000000000002",
       "oracle": "0x4000000000000000000000000000000000000004",
       "irm": "0x6000000000000000000000000000000000000006",
       "lltv": "770000000000000000",
       "collateral_factor_bps": 8500,
       "collateral_symbol": "WETH", "loan_symbol": "USDC"},
      {"loan_token": "0x1000000000000000000000000000000000000001",
       "collateral_token": "0x3000000000000000000000000000000000000003",
       "oracle": "0x5000000000000000000000000000000000000005",
       "lltv": 860000000000000000,
       "collateral_factor_bps": 7000,
       "collateral_decimals": 8,
       "supported": false}
    ]
  })";
  MarketRegistry r = MarketRegistry::LoadFromJson(doc);
  REQUIRE(r.Size() == 2);
  REQUIRE(r.At(0).id == DeriveMarketId(kUsdc, kWeth, kWethOracle, kIrm, 770000000000000000ULL));
  REQUIRE(r.At(0).loan_decimals == 6);
  REQUIRE(r.At(0).Label() == "WETH/USDC");
  REQUIRE(r.At(1).collateral_decimals == 8);
  REQUIRE_FALSE(r.At(1).supported);

  SECTION("a document without markets is rejected") {
    REQUIRE_THROWS(MarketRegistry::LoadFromJson(R"({"pools": []})"));
  }
  SECTION("validation applies to loaded markets") {
    const std::string bad = R"({"markets": [{"loan_token": "0x1000000000000000000000000000000000000001",
      "collateral_token": "0x2000000000000000000000000000000000000002",
      "oracle": "0x4000000000000000000000000000000000000004",
      "lltv": "770000000000000000", "collateral_factor_bps": 12000}]})";
    REQUIRE_THROWS_AS(MarketRegistry::LoadFromJson(bad), MarginError);
  }
}
