#pragma once
#include <optional>
#include <string>
#include <utility>

enum class ExternalErrorKind { UNAVAILABLE, TIMEOUT, INVALID_RESPONSE, NOT_FOUND, REJECTED };

struct ExternalCallError {
  ExternalErrorKind kind = ExternalErrorKind::UNAVAILABLE;
  std::string detail;
};

inline const char* ExternalErrorKindName(ExternalErrorKind k) {
  switch (k) {
    case ExternalErrorKind::UNAVAILABLE: return "unavailable";
    case ExternalErrorKind::TIMEOUT: return "timeout";
    case ExternalErrorKind::INVALID_RESPONSE: return "invalid_response";
    case ExternalErrorKind::NOT_FOUND: return "not_found";
    case ExternalErrorKind::REJECTED: return "rejected";
  }
  return "unknown";
}

inline std::string Describe(const ExternalCallError& e) {
  return std::string(ExternalErrorKindName(e.kind)) + (e.detail.empty() ? "" : " (" + e.detail + ")");
}

// Outcome of a collaborator call: a value or the reason the call failed.
// Callers decide whether a failure is a degraded mode or a hard error.
template <typename T>
class CallResult {
public:
  static CallResult Success(T value) { CallResult r; r.value_ = std::move(value); return r; }
  static CallResult Failure(ExternalErrorKind kind, std::string detail = {}) {
    CallResult r; r.error_ = ExternalCallError{kind, std::move(detail)}; return r;
  }
  static CallResult Failure(ExternalCallError error) { CallResult r; r.error_ = std::move(error); return r; }

  bool Ok() const { return value_.has_value(); }
  const T& Value() const { return *value_; }
  T& Value() { return *value_; }
  const ExternalCallError& Error() const { return error_; }
private:
  CallResult() = default;
  std::optional<T> value_;
  ExternalCallError error_;
};

class CallStatus {
public:
  static CallStatus Success() { CallStatus s; s.ok_ = true; return s; }
  static CallStatus Failure(ExternalErrorKind kind, std::string detail = {}) {
    CallStatus s; s.error_ = ExternalCallError{kind, std::move(detail)}; return s;
  }
  static CallStatus Failure(ExternalCallError error) { CallStatus s; s.error_ = std::move(error); return s; }
  bool Ok() const { return ok_; }
  const ExternalCallError& Error() const { return error_; }
private:
  CallStatus() = default;
  bool ok_ = false;
  ExternalCallError error_;
};
