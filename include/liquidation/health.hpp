#pragma once
#include <limits>
#include <string>

constexpr double kInfiniteHealthFactor = std::numeric_limits<double>::infinity();

struct RiskParams {
  // Minimum health factor ((net - debt) / debt) of a healthy account
  double liquidation_threshold = 0.05;
  // Share of seized collateral kept by the protocol
  int liquidation_incentive_bps = 500;
  std::string fee_recipient;
};

// Throws MarginError(INVALID_RISK_PARAMS / ZERO_ADDRESS)
void ValidateRiskParams(const RiskParams& params);

struct HealthStatus {
  long double collateral_value = 0.0L; // after collateral factors
  long double debt_value = 0.0L;
  long double external_equity = 0.0L;  // signed, 0 when the exchange account is absent
  double health_factor = kInfiniteHealthFactor;
  bool healthy = true;

  bool Infinite() const { return health_factor == kInfiniteHealthFactor; }
};

// Zero debt is always healthy. Only positive external equity adds to net value.
HealthStatus ComputeHealth(long double collateral_value, long double debt_value,
                           long double external_equity, double liquidation_threshold);

std::string FormatHealthFactor(double hf);
