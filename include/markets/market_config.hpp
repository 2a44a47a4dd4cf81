#pragma once
#include <string>

constexpr int kBpsDenominator = 10000;
constexpr unsigned long long kWad = 1000000000000000000ULL; // 1e18
constexpr int kMaxTokenDecimals = 36;

// One supported lending market. Immutable after registration.
struct MarketConfig {
  std::string id;                // derived, see DeriveMarketId
  std::string loan_token;
  std::string collateral_token;
  std::string oracle;
  std::string irm;
  unsigned long long lltv = 0;   // 1e18 scaled, enforced by the lending market itself
  int collateral_factor_bps = 0; // share of collateral value counted toward health, <= 10000
  int collateral_decimals = 18;
  int loan_decimals = 6;
  std::string collateral_symbol;
  std::string loan_symbol;
  bool supported = true;

  long double CollateralFactor() const { return static_cast<long double>(collateral_factor_bps) / kBpsDenominator; }
  std::string Label() const;
};

// keccak256(abi.encode(loanToken, collateralToken, oracle, irm, lltv))
std::string DeriveMarketId(const std::string& loan_token,
                           const std::string& collateral_token,
                           const std::string& oracle,
                           const std::string& irm,
                           unsigned long long lltv);

// Throws MarginError (configuration category) on the first failed check.
void ValidateMarketConfig(const MarketConfig& cfg);
