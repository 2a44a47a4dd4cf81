#pragma once
#include <string>

namespace JsonRpcUtil {
  // Returns the "result" field as string (raw), throws RpcError on a JSON-RPC error object
  std::string ExtractResult(const std::string& json_body);
  // Extract error message if present, empty otherwise
  std::string ExtractError(const std::string& json_body);
}
