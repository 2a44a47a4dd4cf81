#include "markets/market_config.hpp"
#include "common/errors.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"

static std::string EncodeAddress(const std::string& addr) {
  return Pad32(ToLowerHex(Strip0x(addr)));
}

std::string DeriveMarketId(const std::string& loan_token,
                           const std::string& collateral_token,
                           const std::string& oracle,
                           const std::string& irm,
                           unsigned long long lltv) {
  std::string enc;
  enc.reserve(64 * 5);
  enc += EncodeAddress(loan_token);
  enc += EncodeAddress(collateral_token);
  enc += EncodeAddress(oracle);
  enc += EncodeAddress(irm);
  enc += Pad32(UintToHex(lltv));
  return Crypto::Keccak256Hex(enc);
}

std::string MarketConfig::Label() const {
  if (!collateral_symbol.empty() && !loan_symbol.empty()) return collateral_symbol + "/" + loan_symbol;
  return id.size() > 10 ? id.substr(0, 10) : id;
}

void ValidateMarketConfig(const MarketConfig& cfg) {
  if (IsZeroAddress(cfg.loan_token)) throw MarginError(ErrorCode::ZERO_ADDRESS, "loan token");
  if (IsZeroAddress(cfg.collateral_token)) throw MarginError(ErrorCode::ZERO_ADDRESS, "collateral token");
  if (IsZeroAddress(cfg.oracle)) throw MarginError(ErrorCode::ZERO_ADDRESS, "oracle");
  for (const auto* addr : {&cfg.loan_token, &cfg.collateral_token, &cfg.oracle}) {
    if (!IsHexString(*addr)) throw MarginError(ErrorCode::ZERO_ADDRESS, "not a hex identifier: " + *addr);
  }
  if (!cfg.irm.empty() && !IsHexString(cfg.irm)) throw MarginError(ErrorCode::ZERO_ADDRESS, "not a hex identifier: " + cfg.irm);
  if (cfg.collateral_factor_bps < 0 || cfg.collateral_factor_bps > kBpsDenominator) {
    throw MarginError(ErrorCode::INVALID_COLLATERAL_FACTOR, std::to_string(cfg.collateral_factor_bps) + " bps");
  }
  if (cfg.lltv == 0 || cfg.lltv > kWad) throw MarginError(ErrorCode::INVALID_LLTV, std::to_string(cfg.lltv));
  if (cfg.collateral_decimals < 0 || cfg.collateral_decimals > kMaxTokenDecimals ||
      cfg.loan_decimals < 0 || cfg.loan_decimals > kMaxTokenDecimals) {
    throw MarginError(ErrorCode::INVALID_DECIMALS, cfg.Label());
  }
}
