#include "config/keeper_config.hpp"
#include "common/config_manager.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <string>

// Risk keys are parsed strictly. A malformed value runs before logging is up,
// so falling back to the default would go unnoticed.
static double RiskDouble(const std::string& key, double default_value) {
  auto v = ConfigManager::Get(key);
  if (!v || v->empty()) return default_value;
  size_t used = 0;
  double out = 0.0;
  try { out = std::stod(*v, &used); } catch (const std::exception&) { used = 0; }
  if (used == 0 || used != v->size()) throw MarginError(ErrorCode::INVALID_RISK_PARAMS, key + " is not a number: " + *v);
  return out;
}

static int RiskInt(const std::string& key, int default_value) {
  auto v = ConfigManager::Get(key);
  if (!v || v->empty()) return default_value;
  size_t used = 0;
  int out = 0;
  try { out = std::stoi(*v, &used); } catch (const std::exception&) { used = 0; }
  if (used == 0 || used != v->size()) throw MarginError(ErrorCode::INVALID_RISK_PARAMS, key + " is not an integer: " + *v);
  return out;
}

KeeperConfig LoadKeeperConfig() {
  KeeperConfig cfg;
  cfg.markets_file = ConfigManager::Get("MARKETS_FILE").value_or(cfg.markets_file);
  if (auto s = ConfigManager::Get("STATE_FILE")) if (!s->empty()) cfg.state_file = *s;

  cfg.risk.liquidation_threshold = RiskDouble("LIQUIDATION_THRESHOLD", cfg.risk.liquidation_threshold);
  cfg.risk.liquidation_incentive_bps = RiskInt("LIQUIDATION_INCENTIVE_BPS", cfg.risk.liquidation_incentive_bps);
  cfg.risk.fee_recipient = ToLowerHex(ConfigManager::GetOrThrow("FEE_RECIPIENT"));
  ValidateRiskParams(cfg.risk);

  cfg.engine_id = ConfigManager::Get("ENGINE_ID").value_or(cfg.engine_id);
  cfg.auto_liquidate = ConfigManager::GetBoolOr("AUTO_LIQUIDATE", false);
  if (auto k = ConfigManager::Get("KEEPER_ADDRESS")) cfg.keeper_address = ToLowerHex(*k);
  if (cfg.auto_liquidate && IsZeroAddress(cfg.keeper_address)) {
    // Seized collateral would be paid to nobody
    throw MarginError(ErrorCode::ZERO_ADDRESS, "KEEPER_ADDRESS is required when AUTO_LIQUIDATE is set");
  }

  if (auto u = ConfigManager::Get("ORACLE_RPC_URL")) if (!u->empty()) cfg.oracle_rpc_url = *u;
  if (auto a = ConfigManager::Get("ORACLE_AUTH_HEADER")) if (!a->empty()) cfg.oracle_auth_header = *a;
  cfg.oracle_timeout_ms = ConfigManager::GetIntOr("ORACLE_TIMEOUT_MS", cfg.oracle_timeout_ms);
  if (cfg.oracle_timeout_ms <= 0) cfg.oracle_timeout_ms = 800;

  cfg.scan_interval_ms = ConfigManager::GetIntOr("SCAN_INTERVAL_MS", cfg.scan_interval_ms);
  cfg.max_scan_rounds = ConfigManager::GetIntOr("MAX_SCAN_ROUNDS", cfg.max_scan_rounds);
  cfg.max_concurrency = ConfigManager::GetIntOr("MAX_CONCURRENCY", cfg.max_concurrency);
  if (cfg.max_concurrency < 1) cfg.max_concurrency = 1;
  cfg.watch_buffer = RiskDouble("WATCH_BUFFER", cfg.watch_buffer);

  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  cfg.log_level = ConfigManager::Get("LOG_LEVEL").value_or(cfg.log_level);
  cfg.log_stderr = ConfigManager::GetBoolOr("LOG_STDERR", cfg.log_stderr);
  cfg.metrics_file = ConfigManager::Get("METRICS_FILE").value_or(cfg.metrics_file);
  return cfg;
}
