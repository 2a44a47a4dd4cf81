#pragma once
#include "liquidation/health.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>

struct WatchEntry {
  std::string owner;
  HealthStatus status;
  double target_buffer = 0.0; // watched while hf <= threshold + buffer; 0 takes the default
  unsigned long long round = 0;
};

// Latest health per account, fed by scan rounds.
class HealthWatchlist {
public:
  explicit HealthWatchlist(double liquidation_threshold) : threshold_(liquidation_threshold) {}
  // Update or insert entries from a scan; returns the healthy entries close to the threshold
  std::vector<WatchEntry> UpsertAndSelectNearThreshold(const std::vector<WatchEntry>& scan,
                                                       double default_buffer);
  // Entries currently liquidatable, largest debt first
  std::vector<WatchEntry> CollectTriggers() const;
  void Remove(const std::string& owner);
  std::vector<WatchEntry> Snapshot() const;
  size_t Size() const;
private:
  double threshold_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, WatchEntry> map_; // key: owner
};
