#include "liquidation/health.hpp"
#include "common/errors.hpp"
#include "markets/market_config.hpp"
#include "utils/hex.hpp"
#include <cmath>
#include <cstdio>

void ValidateRiskParams(const RiskParams& params) {
  if (!std::isfinite(params.liquidation_threshold) || params.liquidation_threshold < 0.0) {
    throw MarginError(ErrorCode::INVALID_RISK_PARAMS, "liquidation threshold " + std::to_string(params.liquidation_threshold));
  }
  if (params.liquidation_incentive_bps < 0 || params.liquidation_incentive_bps > kBpsDenominator) {
    throw MarginError(ErrorCode::INVALID_RISK_PARAMS, "incentive " + std::to_string(params.liquidation_incentive_bps) + " bps");
  }
  if (IsZeroAddress(params.fee_recipient)) throw MarginError(ErrorCode::ZERO_ADDRESS, "fee recipient");
}

HealthStatus ComputeHealth(long double collateral_value, long double debt_value,
                           long double external_equity, double liquidation_threshold) {
  HealthStatus s;
  s.collateral_value = collateral_value;
  s.debt_value = debt_value;
  s.external_equity = external_equity;
  if (debt_value <= 0.0L) {
    s.health_factor = kInfiniteHealthFactor;
    s.healthy = true;
    return s;
  }
  const long double net = collateral_value + (external_equity > 0.0L ? external_equity : 0.0L);
  if (net < debt_value) {
    s.health_factor = 0.0;
    s.healthy = false;
    return s;
  }
  s.health_factor = static_cast<double>((net - debt_value) / debt_value);
  s.healthy = s.health_factor >= liquidation_threshold;
  return s;
}

std::string FormatHealthFactor(double hf) {
  if (hf == kInfiniteHealthFactor) return "inf";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.4f", hf);
  return std::string(buf);
}
