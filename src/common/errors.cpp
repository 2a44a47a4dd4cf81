#include "common/errors.hpp"

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::INVALID_COLLATERAL_FACTOR: return "InvalidCollateralFactor";
    case ErrorCode::INVALID_LLTV: return "InvalidLltv";
    case ErrorCode::INVALID_DECIMALS: return "InvalidDecimals";
    case ErrorCode::DUPLICATE_MARKET: return "DuplicateMarket";
    case ErrorCode::ZERO_ADDRESS: return "ZeroAddress";
    case ErrorCode::INVALID_RISK_PARAMS: return "InvalidRiskParams";
    case ErrorCode::UNKNOWN_MARKET: return "UnknownMarket";
    case ErrorCode::UNAUTHORIZED: return "Unauthorized";
    case ErrorCode::PORTFOLIO_HEALTHY: return "PortfolioHealthy";
    case ErrorCode::NO_SUB_ACCOUNT: return "NoSubAccount";
    case ErrorCode::SUB_ACCOUNT_EXISTS: return "SubAccountExists";
    case ErrorCode::WOULD_BE_UNHEALTHY: return "WouldBeUnhealthy";
    case ErrorCode::INSUFFICIENT_COLLATERAL: return "InsufficientCollateral";
    case ErrorCode::INSUFFICIENT_BALANCE: return "InsufficientBalance";
    case ErrorCode::INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
    case ErrorCode::ZERO_AMOUNT: return "ZeroAmount";
    case ErrorCode::NOTHING_TO_LIQUIDATE: return "NothingToLiquidate";
    case ErrorCode::ORACLE_UNAVAILABLE: return "OracleUnavailable";
    case ErrorCode::INVALID_PRICE: return "InvalidPrice";
    case ErrorCode::EXTERNAL_CALL_FAILED: return "ExternalCallFailed";
  }
  return "Unknown";
}

ErrorCategory CategoryOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::INVALID_COLLATERAL_FACTOR:
    case ErrorCode::INVALID_LLTV:
    case ErrorCode::INVALID_DECIMALS:
    case ErrorCode::DUPLICATE_MARKET:
    case ErrorCode::ZERO_ADDRESS:
    case ErrorCode::INVALID_RISK_PARAMS:
    case ErrorCode::UNKNOWN_MARKET:
      return ErrorCategory::CONFIGURATION;
    case ErrorCode::UNAUTHORIZED:
      return ErrorCategory::AUTHORIZATION;
    case ErrorCode::ORACLE_UNAVAILABLE:
    case ErrorCode::INVALID_PRICE:
    case ErrorCode::EXTERNAL_CALL_FAILED:
      return ErrorCategory::EXTERNAL_DEPENDENCY;
    default:
      return ErrorCategory::PRECONDITION;
  }
}

const char* ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::CONFIGURATION: return "configuration";
    case ErrorCategory::AUTHORIZATION: return "authorization";
    case ErrorCategory::PRECONDITION: return "precondition";
    case ErrorCategory::EXTERNAL_DEPENDENCY: return "external";
  }
  return "unknown";
}

MarginError::MarginError(ErrorCode code, const std::string& detail)
  : std::runtime_error(std::string(ErrorCodeName(code)) + (detail.empty() ? "" : ": " + detail)),
    code_(code), detail_(detail) {}
