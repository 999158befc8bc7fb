#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace JsonRpcUtil {
  // Parses a response body and returns its "result" member; throws on a JSON-RPC error or missing result.
  nlohmann::json ExtractResult(const std::string& json_body);
  // Returns the "result" member as a raw string (strings unquoted, everything else dumped).
  std::string ExtractResultString(const std::string& json_body);
  // "0x1b4" -> 436. Throws std::invalid_argument on empty or non-hex input.
  unsigned long long ParseHexQuantity(const std::string& hex);
  // 436 -> "0x1b4"
  std::string ToHexQuantity(unsigned long long value);
}
