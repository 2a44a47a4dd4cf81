#pragma once
#include "liquidation/watchlist.hpp"
#include <string>
#include <vector>

class SubAccountRegistry;
class LiquidationEngine;
class ThreadPool;

struct ScanOptions {
  bool auto_liquidate = false;
  std::string keeper_address; // liquidation caller
  double watch_buffer = 0.05;
};

struct ScanReport {
  unsigned long long round = 0;
  size_t evaluated = 0;
  size_t failed = 0;            // aggregation errors (oracle, collaborators)
  size_t near_threshold = 0;
  size_t liquidatable = 0;
  size_t liquidated = 0;
  size_t liquidation_failures = 0;
};

// One keeper pass: evaluates every sub-account on the pool, refreshes the
// watchlist and optionally liquidates what it found unhealthy.
class HealthScanner {
public:
  HealthScanner(SubAccountRegistry& sub_accounts, LiquidationEngine& engine,
                HealthWatchlist& watchlist, ThreadPool& pool, ScanOptions options);
  ScanReport RunRound();
  unsigned long long Rounds() const { return round_; }
private:
  SubAccountRegistry& sub_accounts_;
  LiquidationEngine& engine_;
  HealthWatchlist& watchlist_;
  ThreadPool& pool_;
  ScanOptions options_;
  unsigned long long round_ = 0;
};
