#include "utils/json_rpc.hpp"
#include "node_connection/rpc_client.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace JsonRpcUtil {
  std::string ExtractResult(const std::string& body) {
    auto j = json::parse(body);
    if (j.contains("error") && !j["error"].is_null()) throw RpcError("rpc error " + j["error"].dump(), false);
    if (!j.contains("result")) throw RpcError("missing result", false);
    if (j["result"].is_string()) return j["result"].get<std::string>();
    return j["result"].dump();
  }
  std::string ExtractError(const std::string& body) {
    auto j = json::parse(body, nullptr, false);
    if (j.is_object() && j.contains("error")) {
      const auto& e = j["error"];
      if (e.is_object() && e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
      return e.dump();
    }
    return std::string();
  }
}
