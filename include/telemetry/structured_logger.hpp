#pragma once
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

// JSON-lines event sink for keeper and liquidation events.
// Events emitted before Initialize() still reach the observer but are not written.
class StructuredLogger {
public:
  using Observer = std::function<void(const nlohmann::json&)>;

  static StructuredLogger& Instance();
  void Initialize(const std::string& file_path);
  void Shutdown();
  // Adds "event" and "ts_ms" to `fields` and enqueues it as one line
  void LogEvent(const std::string& event, nlohmann::json fields = nlohmann::json::object());
  void LogJsonLine(const std::string& json_line);
  // Called synchronously for every event; pass nullptr to clear
  void SetObserver(Observer observer);
private:
  StructuredLogger();
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
  std::mutex observer_mutex_;
  Observer observer_;
};
