#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "common/errors.hpp"
#include "telemetry/structured_logger.hpp"
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

using namespace testing_support;

namespace {

ErrorCode CodeOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const MarginError& e) {
    return e.Code();
  }
  FAIL("expected a MarginError");
  return ErrorCode::EXTERNAL_CALL_FAILED;
}

// Records every structured event while in scope
struct EventRecorder {
  EventRecorder() {
    StructuredLogger::Instance().SetObserver([this](const nlohmann::json& j) { events.push_back(j); });
  }
  ~EventRecorder() { StructuredLogger::Instance().SetObserver(nullptr); }
  size_t Count(const std::string& name) const {
    size_t n = 0;
    for (const auto& e : events) if (e.value("event", "") == name) ++n;
    return n;
  }
  std::vector<nlohmann::json> events;
};

}

TEST_CASE("Scenario C liquidation splits collateral between caller and fee recipient", "[liquidation][scenario]") {
  World w({WethMarket()});
  SetUpScenarioA(w, kAlice);
  w.oracle.SetPrice(w.MarketId(0), 2000.0L);
  EventRecorder rec;

  LiquidationResult r = w.engine.Liquidate(kAlice, kLiquidator);

  REQUIRE_FALSE(r.health_before.healthy);
  REQUIRE(r.incentive_bps == 500);
  REQUIRE(r.equity_withdrawn == 0);
  REQUIRE(r.repaid.empty());
  REQUIRE(r.seized.size() == 1);
  REQUIRE(r.seized[0].amount == 10 * kOneEth);
  REQUIRE(r.seized[0].to_liquidator == 9500000000000000000ULL);
  REQUIRE(r.seized[0].to_fee_recipient == 500000000000000000ULL);

  REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) == 9500000000000000000ULL);
  REQUIRE(w.ledger.BalanceOf(kFeeRecipient, kWeth) == 500000000000000000ULL);
  REQUIRE(w.ledger.BalanceOf(w.SubId(kAlice), kWeth) == 0);
  REQUIRE(w.Position(kAlice, 0).collateral == 0);

  SECTION("residual debt is written off as bad debt") {
    REQUIRE(r.bad_debt.size() == 1);
    REQUIRE(r.bad_debt[0].assets == 19000 * kOneUsdc);
    REQUIRE(w.Position(kAlice, 0).borrow_shares == 0);
  }
  SECTION("completion record is emitted once") {
    REQUIRE(rec.Count("liquidation_completed") == 1);
    REQUIRE(rec.Count("liquidation_partial") == 0);
  }
  SECTION("second liquidation fails with PortfolioHealthy") {
    REQUIRE(CodeOf([&]{ w.engine.Liquidate(kAlice, kLiquidator); }) == ErrorCode::PORTFOLIO_HEALTHY);
    REQUIRE(rec.Count("liquidation_completed") == 1);
  }
}

TEST_CASE("Healthy accounts cannot be liquidated", "[liquidation]") {
  World w({WethMarket()});
  SetUpScenarioA(w, kAlice);
  REQUIRE(CodeOf([&]{ w.engine.Liquidate(kAlice, kLiquidator); }) == ErrorCode::PORTFOLIO_HEALTHY);
  REQUIRE(w.Position(kAlice, 0).collateral == 10 * kOneEth);
}

TEST_CASE("Owners without a sub-account are rejected", "[liquidation]") {
  World w({WethMarket()});
  REQUIRE(CodeOf([&]{ w.engine.Liquidate(kBob, kLiquidator); }) == ErrorCode::NO_SUB_ACCOUNT);
  REQUIRE(CodeOf([&]{ w.engine.Liquidate(kBob, "0x0"); }) == ErrorCode::ZERO_ADDRESS);
}

TEST_CASE("Incentive split loses nothing to rounding", "[liquidation][property]") {
  const u128 amounts[] = {1, 19, 21, 333333333333ULL, 1234567890123456789ULL, 250 * kOneEth + 7};
  const int incentives[] = {0, 1, 333, 500, 9999, 10000};
  for (int bps : incentives) {
    for (u128 amount : amounts) {
      RiskParams risk = DefaultRisk();
      risk.liquidation_incentive_bps = bps;
      World w({WethMarket()}, risk);
      w.oracle.SetPrice(w.MarketId(0), 3000.0L);
      w.OpenWithCollateral(kAlice, 0, amount + 10 * kOneEth);
      w.service.Borrow(kAlice, kAlice, w.MarketId(0), 19000 * kOneUsdc);
      w.oracle.SetPrice(w.MarketId(0), 1.0L);

      LiquidationResult r = w.engine.Liquidate(kAlice, kLiquidator);
      REQUIRE(r.seized.size() == 1);
      const auto& s = r.seized[0];
      REQUIRE(s.to_liquidator + s.to_fee_recipient == s.amount);
      REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) + w.ledger.BalanceOf(kFeeRecipient, kWeth) == s.amount);
      REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) == s.to_liquidator);
      // No zero-amount transfer is recorded as a payout
      if (bps == 10000) REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) == 0);
      if (bps == 0) REQUIRE(w.ledger.BalanceOf(kFeeRecipient, kWeth) == 0);
    }
  }
}

TEST_CASE("Exchange funds repay debt before collateral is seized", "[liquidation]") {
  World w({WethMarket()});
  SetUpScenarioA(w, kAlice);
  w.ledger.Credit(kAlice, kUsdc, 4000 * kOneUsdc);
  w.service.DepositToExchange(kAlice, kAlice, kUsdc, 4000 * kOneUsdc);
  w.exchange.SetUnrealizedPnl(w.SubId(kAlice), -1000.0L);
  // equity 3000, withdrawable 3000 USDC
  w.oracle.SetPrice(w.MarketId(0), 1500.0L);

  LiquidationResult r = w.engine.Liquidate(kAlice, kLiquidator);
  REQUIRE(r.equity_withdrawn == 3000 * kOneUsdc);
  REQUIRE(r.equity_token == kUsdc);
  REQUIRE(r.repaid.size() == 1);
  REQUIRE(r.repaid[0].assets == 3000 * kOneUsdc);
  REQUIRE(w.ledger.BalanceOf(w.SubId(kAlice), kUsdc) == 0);
  REQUIRE(r.seized.size() == 1);
  // everything seized, so the 16,000 left is written off
  REQUIRE(r.bad_debt.size() == 1);
  REQUIRE(r.bad_debt[0].assets == 16000 * kOneUsdc);
}

TEST_CASE("Repayment walks markets in registration order", "[liquidation]") {
  World w({WethMarket(), WbtcMarket()});
  w.oracle.SetPrice(w.MarketId(0), 3000.0L);
  w.oracle.SetPrice(w.MarketId(1), 60000.0L);
  w.OpenWithCollateral(kAlice, 0, 10 * kOneEth);
  w.OpenWithCollateral(kAlice, 1, kOneBtc);
  w.service.Borrow(kAlice, kAlice, w.MarketId(0), 20000 * kOneUsdc);
  w.service.Borrow(kAlice, kAlice, w.MarketId(1), 30000 * kOneUsdc);
  w.ledger.Credit(kAlice, kUsdc, 25000 * kOneUsdc);
  w.service.DepositToExchange(kAlice, kAlice, kUsdc, 25000 * kOneUsdc);
  w.exchange.SetUnrealizedPnl(w.SubId(kAlice), -20000.0L);
  // equity 5000; collateral 10*1000*0.85 + 1*20000*0.7 = 22500 vs debt 50000
  w.oracle.SetPrice(w.MarketId(0), 1000.0L);
  w.oracle.SetPrice(w.MarketId(1), 20000.0L);

  LiquidationResult r = w.engine.Liquidate(kAlice, kLiquidator);
  REQUIRE(r.equity_withdrawn == 5000 * kOneUsdc);
  REQUIRE(r.repaid.size() == 1);
  REQUIRE(r.repaid[0].market_id == w.MarketId(0));
  REQUIRE(r.repaid[0].assets == 5000 * kOneUsdc);
  REQUIRE(r.seized.size() == 2);
  REQUIRE(r.seized[0].market_id == w.MarketId(0));
  REQUIRE(r.seized[1].market_id == w.MarketId(1));
  REQUIRE(w.ledger.BalanceOf(kLiquidator, kWbtc) == 95000000ULL);
  REQUIRE(w.ledger.BalanceOf(kFeeRecipient, kWbtc) == 5000000ULL);
  REQUIRE(r.bad_debt.size() == 2);
}

TEST_CASE("A failure after committed steps is not rolled back", "[liquidation]") {
  World w({WethMarket(), WbtcMarket()});
  w.oracle.SetPrice(w.MarketId(0), 3000.0L);
  w.oracle.SetPrice(w.MarketId(1), 60000.0L);
  w.OpenWithCollateral(kAlice, 0, 10 * kOneEth);
  w.OpenWithCollateral(kAlice, 1, kOneBtc);
  w.service.Borrow(kAlice, kAlice, w.MarketId(0), 40000 * kOneUsdc);
  w.oracle.SetPrice(w.MarketId(0), 1000.0L);
  w.oracle.SetPrice(w.MarketId(1), 20000.0L);
  w.lending.InjectFailure(w.MarketId(1), LendingOp::WITHDRAW_COLLATERAL);
  EventRecorder rec;

  try {
    w.engine.Liquidate(kAlice, kLiquidator);
    FAIL("liquidation should fail on the second market");
  } catch (const MarginError& e) {
    REQUIRE(e.Code() == ErrorCode::EXTERNAL_CALL_FAILED);
    REQUIRE(e.Category() == ErrorCategory::EXTERNAL_DEPENDENCY);
  }
  // First market stays seized
  REQUIRE(w.Position(kAlice, 0).collateral == 0);
  REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) == 9500000000000000000ULL);
  REQUIRE(w.Position(kAlice, 1).collateral == kOneBtc);
  REQUIRE(rec.Count("liquidation_partial") == 1);
  REQUIRE(rec.Count("liquidation_completed") == 0);

  SECTION("a retry finishes the job once the market recovers") {
    w.lending.ClearFailures();
    LiquidationResult r = w.engine.Liquidate(kAlice, kLiquidator);
    REQUIRE(r.seized.size() == 1);
    REQUIRE(r.seized[0].market_id == w.MarketId(1));
    REQUIRE(r.bad_debt.size() == 1);
    REQUIRE(w.engine.EvaluateHealth(kAlice).healthy);
  }
}

TEST_CASE("Exchange outage aborts liquidation before anything moves", "[liquidation]") {
  World w({WethMarket()});
  SetUpScenarioA(w, kAlice);
  w.oracle.SetPrice(w.MarketId(0), 2000.0L);
  w.exchange.SetUnavailable(true);
  EventRecorder rec;
  REQUIRE(CodeOf([&]{ w.engine.Liquidate(kAlice, kLiquidator); }) == ErrorCode::EXTERNAL_CALL_FAILED);
  REQUIRE(w.Position(kAlice, 0).collateral == 10 * kOneEth);
  REQUIRE(rec.Count("liquidation_partial") == 0);
}

TEST_CASE("Collateral stranded by an interrupted seize is paid out on retry", "[liquidation]") {
  World w({WethMarket()});
  SetUpScenarioA(w, kAlice);
  w.oracle.SetPrice(w.MarketId(0), 2000.0L);
  // A liquidator balance at the ceiling makes the payout fail after the
  // collateral has already left the market
  w.ledger.Credit(kLiquidator, kWeth, kMaxAmount);
  EventRecorder rec;

  REQUIRE(CodeOf([&]{ w.engine.Liquidate(kAlice, kLiquidator); }) == ErrorCode::INSUFFICIENT_BALANCE);
  REQUIRE(w.Position(kAlice, 0).collateral == 0);
  REQUIRE(w.ledger.BalanceOf(w.SubId(kAlice), kWeth) == 10 * kOneEth);
  REQUIRE(w.Position(kAlice, 0).borrow_shares > 0);
  REQUIRE(rec.Count("liquidation_partial") == 1);

  SECTION("retry sweeps the held collateral before writing off debt") {
    w.ledger.Debit(kLiquidator, kWeth, kMaxAmount);
    LiquidationResult r = w.engine.Liquidate(kAlice, kLiquidator);
    REQUIRE(r.seized.size() == 1);
    REQUIRE(r.seized[0].amount == 10 * kOneEth);
    REQUIRE(r.seized[0].held == 10 * kOneEth);
    REQUIRE(r.seized[0].to_liquidator == 95 * kOneEth / 10);
    REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) == 95 * kOneEth / 10);
    REQUIRE(w.ledger.BalanceOf(kFeeRecipient, kWeth) == kOneEth / 2);
    REQUIRE(w.ledger.BalanceOf(w.SubId(kAlice), kWeth) == 0);
    REQUIRE(r.bad_debt.size() == 1);
    REQUIRE(w.engine.EvaluateHealth(kAlice).healthy);
  }
  SECTION("held collateral blocks the bad-debt write-off") {
    // Still failing: nothing is written off while the sub-account holds collateral
    REQUIRE(CodeOf([&]{ w.engine.Liquidate(kAlice, kLiquidator); }) == ErrorCode::INSUFFICIENT_BALANCE);
    REQUIRE(w.Position(kAlice, 0).borrow_shares > 0);
    REQUIRE(w.ledger.BalanceOf(w.SubId(kAlice), kWeth) == 10 * kOneEth);
  }
}

TEST_CASE("One keeper liquidates several Scenario C accounts", "[liquidation]") {
  World w({WethMarket()});
  SetUpScenarioA(w, kAlice);
  w.OpenWithCollateral(kBob, 0, 10 * kOneEth);
  w.service.Borrow(kBob, kBob, w.MarketId(0), 19000 * kOneUsdc);
  w.oracle.SetPrice(w.MarketId(0), 2000.0L);

  w.engine.Liquidate(kBob, kLiquidator);
  w.engine.Liquidate(kAlice, kLiquidator);
  REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) == 19 * kOneEth);
  REQUIRE(w.ledger.BalanceOf(kFeeRecipient, kWeth) == kOneEth);
  REQUIRE(w.ledger.BalanceOf(w.SubId(kAlice), kWeth) == 0);
  REQUIRE(w.ledger.BalanceOf(w.SubId(kBob), kWeth) == 0);
}

TEST_CASE("Concurrent liquidations seize each account once", "[liquidation][concurrency]") {
  for (int round = 0; round < 50; ++round) {
    World w({WethMarket()});
    SetUpScenarioA(w, kAlice);
    w.OpenWithCollateral(kBob, 0, 10 * kOneEth);
    w.service.Borrow(kBob, kBob, w.MarketId(0), 19000 * kOneUsdc);
    w.oracle.SetPrice(w.MarketId(0), 2000.0L);

    std::atomic<int> completed{0};
    std::atomic<int> already_healthy{0};
    std::atomic<int> other_errors{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&, t] {
        const std::string order[2] = {t % 2 ? kBob : kAlice, t % 2 ? kAlice : kBob};
        for (const auto& owner : order) {
          try {
            w.engine.Liquidate(owner, kLiquidator);
            ++completed;
          } catch (const MarginError& e) {
            if (e.Code() == ErrorCode::PORTFOLIO_HEALTHY) ++already_healthy;
            else ++other_errors;
          }
        }
      });
    }
    for (auto& th : threads) th.join();

    REQUIRE(completed.load() == 2);
    REQUIRE(already_healthy.load() == 6);
    REQUIRE(other_errors.load() == 0);
    REQUIRE(w.ledger.BalanceOf(kLiquidator, kWeth) == 19 * kOneEth);
    REQUIRE(w.ledger.BalanceOf(kFeeRecipient, kWeth) == kOneEth);
  }
}

namespace {

// Lending venue that has already socialized bad debt elsewhere: writes off nothing.
class NoWriteOffLendingMarket : public InMemoryLendingMarket {
public:
  using InMemoryLendingMarket::InMemoryLendingMarket;
  CallResult<u128> RealizeBadDebt(const std::string&, const std::string&) override {
    return CallResult<u128>::Success(0);
  }
};

}

TEST_CASE("Unhealthy account with nothing left to unwind", "[liquidation]") {
  MarketRegistry markets;
  markets.AddMarket(WethMarket());
  TokenLedger ledger;
  SubAccountRegistry subs(ledger, kEngine);
  NoWriteOffLendingMarket lending(markets);
  InMemoryMarginExchange exchange;
  StaticPriceOracle oracle;
  PositionAggregator aggregator(markets, lending, exchange, oracle, subs);
  LiquidationEngine engine(markets, lending, exchange, subs, ledger, aggregator, DefaultRisk());
  MarginAccountService service(markets, lending, exchange, subs, ledger, aggregator, engine);
  const std::string market = markets.At(0).id;
  lending.SeedLiquidity(market, 100000 * kOneUsdc);
  oracle.SetPrice(market, 3000.0L);
  service.CreateSubAccount(kAlice);
  ledger.Credit(kAlice, kWeth, kOneEth);
  service.DepositCollateral(kAlice, kAlice, market, kOneEth);
  service.Borrow(kAlice, kAlice, market, 2000 * kOneUsdc);
  oracle.SetPrice(market, 1000.0L);

  LiquidationResult first = engine.Liquidate(kAlice, kLiquidator);
  REQUIRE(first.seized.size() == 1);
  REQUIRE(first.bad_debt.empty());

  EventRecorder rec;
  REQUIRE_FALSE(engine.EvaluateHealth(kAlice).healthy);
  REQUIRE(CodeOf([&]{ engine.Liquidate(kAlice, kLiquidator); }) == ErrorCode::NOTHING_TO_LIQUIDATE);
  REQUIRE(rec.Count("liquidation_completed") == 0);
  REQUIRE(rec.Count("liquidation_partial") == 0);
}

TEST_CASE("Completion listener sees each successful liquidation", "[liquidation]") {
  World w({WethMarket()});
  SetUpScenarioA(w, kAlice);
  std::vector<std::string> seen;
  w.engine.SetCompletionListener([&](const LiquidationResult& r) { seen.push_back(r.owner); });
  w.oracle.SetPrice(w.MarketId(0), 2000.0L);
  w.engine.Liquidate(kAlice, kLiquidator);
  REQUIRE(seen.size() == 1);
  REQUIRE(seen[0] == kAlice);
}
