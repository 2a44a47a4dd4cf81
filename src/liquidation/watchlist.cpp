#include "liquidation/watchlist.hpp"
#include <algorithm>

std::vector<WatchEntry> HealthWatchlist::UpsertAndSelectNearThreshold(const std::vector<WatchEntry>& scan,
                                                                      double default_buffer) {
  std::vector<WatchEntry> near;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& e : scan) {
    WatchEntry copy = e;
    if (copy.target_buffer <= 0.0) copy.target_buffer = default_buffer;
    map_[copy.owner] = copy;
    if (copy.status.healthy && !copy.status.Infinite() &&
        copy.status.health_factor <= threshold_ + copy.target_buffer) {
      near.push_back(copy);
    }
  }
  return near;
}

std::vector<WatchEntry> HealthWatchlist::CollectTriggers() const {
  std::vector<WatchEntry> triggers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : map_) {
      if (!kv.second.status.healthy) triggers.push_back(kv.second);
    }
  }
  std::sort(triggers.begin(), triggers.end(), [](const WatchEntry& a, const WatchEntry& b) {
    if (a.status.debt_value != b.status.debt_value) return a.status.debt_value > b.status.debt_value;
    return a.owner < b.owner;
  });
  return triggers;
}

void HealthWatchlist::Remove(const std::string& owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  map_.erase(owner);
}

std::vector<WatchEntry> HealthWatchlist::Snapshot() const {
  std::vector<WatchEntry> v;
  std::lock_guard<std::mutex> lock(mutex_);
  v.reserve(map_.size());
  for (const auto& kv : map_) v.push_back(kv.second);
  return v;
}

size_t HealthWatchlist::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return map_.size();
}
