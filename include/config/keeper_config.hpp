#pragma once
#include "liquidation/health.hpp"
#include <optional>
#include <string>

struct KeeperConfig {
  std::string markets_file = "markets.json";
  std::optional<std::string> state_file;
  RiskParams risk;
  std::string keeper_address;           // caller used for automatic liquidations
  std::string engine_id = "margin-engine"; // manager identity of every sub-account
  // Oracle: JSON-RPC price() reads when set, operator prices from the state file otherwise
  std::optional<std::string> oracle_rpc_url;
  std::optional<std::string> oracle_auth_header;
  int oracle_timeout_ms = 800;
  int scan_interval_ms = 2000;
  int max_scan_rounds = 0;              // 0 runs until stopped
  int max_concurrency = 2;
  bool auto_liquidate = false;
  double watch_buffer = 0.05;
  std::string log_file = "keeper.log";
  std::string log_level = "info";
  bool log_stderr = false;
  std::string metrics_file = "metrics.jsonl";
};

// Reads keeper settings from ConfigManager. Throws on missing required keys
// or invalid risk parameters.
KeeperConfig LoadKeeperConfig();
