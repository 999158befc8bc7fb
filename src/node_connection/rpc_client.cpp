#include "node_connection/rpc_client.hpp"
#include "net/http_client.hpp"
#include "common/logger.hpp"
#include "utils/json_rpc.hpp"
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>
#include <unordered_map>

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
    if (!name.empty() && !value.empty() && name.find(' ') == std::string::npos) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

RpcClient::RpcClient(HttpClient& http,
                     const std::string& endpoint_url,
                     const std::optional<std::string>& auth_header,
                     int default_timeout_ms)
  : http_(http), endpoint_(endpoint_url), auth_header_(auth_header), default_timeout_ms_(default_timeout_ms) {
  default_headers_.reserve(2);
  default_headers_["Content-Type"] = "application/json";
  if (auth_header_ && !auth_header_->empty()) {
    ApplyAuthHeader(default_headers_, auth_header_);
  }
}

std::string RpcClient::BuildPayload(const std::string& method, const std::vector<std::string>& params) {
  static const std::string prefix = "{\"jsonrpc\":\"2.0\",\"method\":\"";
  static const std::string mid = "\",\"params\":[";
  static const std::string id_part = "],\"id\":";
  size_t total_params_len = 0; for (const auto& p : params) total_params_len += p.size();
  std::string out; out.reserve(prefix.size() + method.size() + mid.size() + total_params_len + params.size() + id_part.size() + 24);
  out += prefix; out += method; out += mid;
  for (size_t i = 0; i < params.size(); ++i) { out += params[i]; if (i + 1 < params.size()) out += ","; }
  out += id_part; out += std::to_string(next_id_++); out += "}";
  return out;
}

std::string RpcClient::Send(const std::string& json_payload, int timeout_ms) {
  auto resp = http_.Post(endpoint_, json_payload, default_headers_, timeout_ms);
  if (resp.status < 200 || resp.status >= 300) {
    Logger::Debug("HTTP POST to " + endpoint_ + " failed status=" + std::to_string(resp.status));
    throw std::runtime_error("HTTP POST failed with status " + std::to_string(resp.status));
  }
  return resp.body;
}

std::string RpcClient::EthBlockNumber() {
  auto payload = BuildPayload("eth_blockNumber", {});
  auto resp = Send(payload, default_timeout_ms_);
  return JsonRpcUtil::ExtractResultString(resp);
}

std::string RpcClient::EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx) {
  std::vector<std::string> params{ "\"" + tag_or_hex + "\"", full_tx ? "true" : "false" };
  auto payload = BuildPayload("eth_getBlockByNumber", params);
  return Send(payload, default_timeout_ms_);
}
