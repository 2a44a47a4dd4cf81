#pragma once
#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

class HttpClient;

// Transport or protocol failure of a JSON-RPC call.
class RpcError : public std::runtime_error {
public:
  RpcError(const std::string& what, bool timed_out) : std::runtime_error(what), timed_out_(timed_out) {}
  bool TimedOut() const { return timed_out_; }
private:
  bool timed_out_;
};

class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt);
  // Sends a raw JSON-RPC payload, returns the response body. Throws RpcError.
  std::string Send(const std::string& json_payload, int timeout_ms = 300);
  // eth_call against `block` (default latest); returns the hex result
  std::string EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block = std::nullopt, int timeout_ms = 300);
  std::string EthBlockNumber(int timeout_ms = 300);
  const std::string& Endpoint() const { return endpoint_; }
private:
  HttpClient& http_;
  std::string endpoint_;
  std::unordered_map<std::string, std::string> default_headers_;
  std::atomic<unsigned long long> next_id_{1};
  std::string BuildPayload(const std::string& method, const std::string& params_json);
};
