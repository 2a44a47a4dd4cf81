#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "utils/json_rpc.hpp"
#include "common/logger.hpp"
#include <cctype>
#include <nlohmann/json.hpp>

static inline std::string Trim(const std::string& s) {
  size_t start = 0, end = s.size();
  while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
  return s.substr(start, end - start);
}

// "Name: value" sets that header; anything else is sent as Authorization.
static void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header_opt) {
  if (!auth_header_opt) return;
  const std::string& raw = *auth_header_opt;
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = Trim(raw.substr(0, pos));
    std::string value = Trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header)
  : http_(http), endpoint_(endpoint_url) {
  default_headers_["Content-Type"] = "application/json";
  ApplyAuthHeader(default_headers_, auth_header);
}

std::string RpcClient::BuildPayload(const std::string& method, const std::string& params_json) {
  nlohmann::json j;
  j["jsonrpc"] = "2.0";
  j["method"] = method;
  j["params"] = nlohmann::json::parse(params_json);
  j["id"] = next_id_.fetch_add(1);
  return j.dump();
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms);
  if (resp.status == 0) {
    throw RpcError("no response from " + endpoint_ + ": " + resp.error, resp.timed_out);
  }
  if (resp.status < 200 || resp.status >= 300) {
    const std::string rpc_error = JsonRpcUtil::ExtractError(resp.body);
    Logger::Error("HTTP POST failed status=" + std::to_string(resp.status) + (rpc_error.empty() ? "" : " " + rpc_error));
    throw RpcError("HTTP status " + std::to_string(resp.status) + (rpc_error.empty() ? "" : ": " + rpc_error), false);
  }
  return resp.body;
}

std::string RpcClient::EthCall(const std::string& to, const std::string& data, const std::optional<std::string>& block, int timeout_ms) {
  nlohmann::json params = nlohmann::json::array();
  params.push_back({{"to", to}, {"data", data}});
  params.push_back(block.value_or("latest"));
  auto resp = Send(BuildPayload("eth_call", params.dump()), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}

std::string RpcClient::EthBlockNumber(int timeout_ms) {
  auto resp = Send(BuildPayload("eth_blockNumber", "[]"), timeout_ms);
  return JsonRpcUtil::ExtractResult(resp);
}
