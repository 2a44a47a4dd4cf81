#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCategory { CONFIGURATION, AUTHORIZATION, PRECONDITION, EXTERNAL_DEPENDENCY };

enum class ErrorCode {
  // configuration
  INVALID_COLLATERAL_FACTOR,
  INVALID_LLTV,
  INVALID_DECIMALS,
  DUPLICATE_MARKET,
  ZERO_ADDRESS,
  INVALID_RISK_PARAMS,
  UNKNOWN_MARKET,
  // authorization
  UNAUTHORIZED,
  // precondition
  PORTFOLIO_HEALTHY,
  NO_SUB_ACCOUNT,
  SUB_ACCOUNT_EXISTS,
  WOULD_BE_UNHEALTHY,
  INSUFFICIENT_COLLATERAL,
  INSUFFICIENT_BALANCE,
  INSUFFICIENT_LIQUIDITY,
  ZERO_AMOUNT,
  NOTHING_TO_LIQUIDATE,
  // external dependency
  ORACLE_UNAVAILABLE,
  INVALID_PRICE,
  EXTERNAL_CALL_FAILED
};

const char* ErrorCodeName(ErrorCode code);
ErrorCategory CategoryOf(ErrorCode code);
const char* ErrorCategoryName(ErrorCategory category);

// Every rejected operation throws one of these; Code() tells callers which check failed.
class MarginError : public std::runtime_error {
public:
  MarginError(ErrorCode code, const std::string& detail);
  ErrorCode Code() const { return code_; }
  ErrorCategory Category() const { return CategoryOf(code_); }
  const std::string& Detail() const { return detail_; }
private:
  ErrorCode code_;
  std::string detail_;
};
