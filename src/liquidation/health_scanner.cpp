#include "liquidation/health_scanner.hpp"
#include "account/sub_account_registry.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "liquidation/liquidation_engine.hpp"
#include "scheduler/thread_pool.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <mutex>

HealthScanner::HealthScanner(SubAccountRegistry& sub_accounts, LiquidationEngine& engine,
                             HealthWatchlist& watchlist, ThreadPool& pool, ScanOptions options)
  : sub_accounts_(sub_accounts), engine_(engine), watchlist_(watchlist), pool_(pool), options_(std::move(options)) {}

ScanReport HealthScanner::RunRound() {
  ScanReport report;
  report.round = ++round_;
  const std::vector<std::string> owners = sub_accounts_.Owners();

  std::mutex results_mutex;
  std::vector<WatchEntry> scanned;
  scanned.reserve(owners.size());
  std::atomic<size_t> failed{0};
  for (const auto& owner : owners) {
    pool_.Enqueue([&, owner]{
      try {
        WatchEntry e;
        e.owner = owner;
        e.status = engine_.EvaluateHealth(owner);
        e.round = report.round;
        std::lock_guard<std::mutex> lock(results_mutex);
        scanned.push_back(std::move(e));
      } catch (const MarginError& err) {
        ++failed;
        Logger::Warning("Health check of " + owner + " failed: " + err.what());
      }
    });
  }
  pool_.WaitIdle();

  // Accounts that could not be valued keep their last known entry
  report.evaluated = scanned.size();
  report.failed = failed.load();
  report.near_threshold = watchlist_.UpsertAndSelectNearThreshold(scanned, options_.watch_buffer).size();
  const std::vector<WatchEntry> triggers = watchlist_.CollectTriggers();
  report.liquidatable = triggers.size();

  if (options_.auto_liquidate) {
    for (const auto& t : triggers) {
      try {
        engine_.Liquidate(t.owner, options_.keeper_address);
        ++report.liquidated;
        watchlist_.Remove(t.owner);
      } catch (const MarginError& err) {
        if (err.Code() == ErrorCode::PORTFOLIO_HEALTHY) {
          // Recovered since the scan
          continue;
        }
        ++report.liquidation_failures;
        Logger::Error("Liquidation of " + t.owner + " failed: " + err.what());
      }
    }
  }

  StructuredLogger::Instance().LogEvent("scan_round", {
    {"round", report.round}, {"evaluated", report.evaluated}, {"failed", report.failed},
    {"near_threshold", report.near_threshold}, {"liquidatable", report.liquidatable},
    {"liquidated", report.liquidated}, {"liquidation_failures", report.liquidation_failures}});
  Logger::Info("Scan round " + std::to_string(report.round) + ": evaluated=" + std::to_string(report.evaluated) +
               " near=" + std::to_string(report.near_threshold) + " liquidatable=" + std::to_string(report.liquidatable) +
               " liquidated=" + std::to_string(report.liquidated));
  return report;
}
