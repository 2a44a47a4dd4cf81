#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/keeper_config.hpp"
#include "markets/market_registry.hpp"
#include "account/token_ledger.hpp"
#include "account/sub_account_registry.hpp"
#include "protocols/in_memory_lending_market.hpp"
#include "protocols/in_memory_margin_exchange.hpp"
#include "oracle/static_price_oracle.hpp"
#include "oracle/rpc_price_oracle.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "liquidation/position_aggregator.hpp"
#include "liquidation/liquidation_engine.hpp"
#include "liquidation/watchlist.hpp"
#include "liquidation/health_scanner.hpp"
#include "margin/margin_account_service.hpp"
#include "scheduler/thread_pool.hpp"
#include "state/state_loader.hpp"
#include "telemetry/structured_logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

static std::atomic<bool> g_stop{false};

static void HandleSignal(int) { g_stop = true; }

int main(int argc, char** argv) {
  try {
    ConfigManager::Initialize(argc > 1 ? argv[1] : ".env");
    const KeeperConfig cfg = LoadKeeperConfig();

    Logger::Initialize(cfg.log_file, ParseLogLevel(cfg.log_level), cfg.log_stderr);
    StructuredLogger::Instance().Initialize(cfg.metrics_file);
    Logger::Info("Portfolio margin keeper starting");

    MarketRegistry markets = MarketRegistry::LoadFromFile(cfg.markets_file);
    if (markets.Empty()) {
      Logger::Critical("No markets configured in " + cfg.markets_file);
      std::cerr << "no markets configured in " << cfg.markets_file << std::endl;
      return 1;
    }
    Logger::Info("Loaded " + std::to_string(markets.Size()) + " market(s) from " + cfg.markets_file);

    TokenLedger ledger;
    SubAccountRegistry sub_accounts(ledger, cfg.engine_id);
    InMemoryLendingMarket lending(markets);
    InMemoryMarginExchange exchange;
    for (const auto& m : markets.Markets()) {
      exchange.RegisterToken(m.loan_token, m.loan_decimals);
      exchange.RegisterToken(m.collateral_token, m.collateral_decimals);
    }

    // Oracle: on-chain price() when an RPC endpoint is configured
    StaticPriceOracle static_oracle;
    std::unique_ptr<HttpClient> http;
    std::unique_ptr<RpcClient> rpc;
    std::unique_ptr<RpcPriceOracle> rpc_oracle;
    PriceOracle* oracle = &static_oracle;
    if (cfg.oracle_rpc_url) {
      HttpClientTuning tuning;
      tuning.connect_timeout_ms = cfg.oracle_timeout_ms;
      http.reset(CreateCurlHttpClient(tuning));
      rpc.reset(new RpcClient(*http, *cfg.oracle_rpc_url, cfg.oracle_auth_header));
      rpc_oracle.reset(new RpcPriceOracle(*rpc, cfg.oracle_timeout_ms));
      oracle = rpc_oracle.get();
      try {
        Logger::Info("Oracle prices from " + *cfg.oracle_rpc_url + " at block " + rpc->EthBlockNumber(cfg.oracle_timeout_ms));
      } catch (const RpcError& e) {
        Logger::Warning("Oracle node not reachable yet: " + std::string(e.what()));
      }
    } else {
      Logger::Info("Oracle prices from state file");
    }

    PositionAggregator aggregator(markets, lending, exchange, *oracle, sub_accounts);
    LiquidationEngine engine(markets, lending, exchange, sub_accounts, ledger, aggregator, cfg.risk);
    MarginAccountService accounts(markets, lending, exchange, sub_accounts, ledger, aggregator, engine);

    if (cfg.state_file) {
      StateTargets targets{markets, accounts, ledger, &lending, &exchange, rpc_oracle ? nullptr : &static_oracle};
      StateLoader::ApplyFile(*cfg.state_file, targets);
    }

    ThreadPool pool(static_cast<size_t>(cfg.max_concurrency));
    HealthWatchlist watchlist(cfg.risk.liquidation_threshold);
    ScanOptions scan_opts;
    scan_opts.auto_liquidate = cfg.auto_liquidate;
    scan_opts.keeper_address = cfg.keeper_address;
    scan_opts.watch_buffer = cfg.watch_buffer;
    HealthScanner scanner(sub_accounts, engine, watchlist, pool, scan_opts);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    Logger::Info("Threshold " + std::to_string(cfg.risk.liquidation_threshold) + ", incentive " +
                 std::to_string(cfg.risk.liquidation_incentive_bps) + " bps, auto-liquidate " +
                 (cfg.auto_liquidate ? "on" : "off"));

    while (!g_stop) {
      ScanReport r = scanner.RunRound();
      std::cout << "round " << r.round << ": accounts=" << r.evaluated << " failed=" << r.failed
                << " near=" << r.near_threshold << " liquidatable=" << r.liquidatable
                << " liquidated=" << r.liquidated << std::endl;
      if (cfg.max_scan_rounds > 0 && r.round >= static_cast<unsigned long long>(cfg.max_scan_rounds)) break;
      const auto wake = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.scan_interval_ms);
      while (!g_stop && std::chrono::steady_clock::now() < wake) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    }

    Logger::Info("Keeper stopped after " + std::to_string(scanner.Rounds()) + " round(s)");
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 0;
  } catch (const std::exception& e) {
    Logger::Critical(std::string("Keeper failed: ") + e.what());
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    Logger::Shutdown();
    return 1;
  }
}
