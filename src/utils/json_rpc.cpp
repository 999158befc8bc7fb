#include "utils/json_rpc.hpp"
#include <cctype>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace JsonRpcUtil {
  json ExtractResult(const std::string& body) {
    json j = json::parse(body);
    if (!j.is_object()) throw std::runtime_error("JSON-RPC response is not an object");
    if (j.contains("error") && !j["error"].is_null()) throw std::runtime_error("JSON-RPC error: " + j["error"].dump());
    if (!j.contains("result")) throw std::runtime_error("JSON-RPC response missing result");
    return j["result"];
  }
  std::string ExtractResultString(const std::string& body) {
    json r = ExtractResult(body);
    if (r.is_string()) return r.get<std::string>();
    return r.dump();
  }
  unsigned long long ParseHexQuantity(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) digits = digits.substr(2);
    if (digits.empty() || digits.size() > 16) throw std::invalid_argument("invalid hex quantity: \"" + hex + "\"");
    for (char c : digits) {
      if (!std::isxdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("invalid hex quantity: \"" + hex + "\"");
    }
    return std::stoull(digits, nullptr, 16);
  }
  std::string ToHexQuantity(unsigned long long value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
  }
}
