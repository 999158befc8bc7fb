#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

class HttpClient;

class RpcClient {
public:
  RpcClient(HttpClient& http,
            const std::string& endpoint_url,
            const std::optional<std::string>& auth_header = std::nullopt,
            int default_timeout_ms = 10000);
  // Sends raw JSON-RPC payload to the endpoint and returns the response body.
  std::string Send(const std::string& json_payload, int timeout_ms);

  // Hex quantity string of the chain head, e.g. "0x12a05f2".
  std::string EthBlockNumber();
  // Full response body; "result" is null when the node does not know the block.
  std::string EthGetBlockByNumber(const std::string& tag_or_hex, bool full_tx = false);
private:
  HttpClient& http_;
  std::string endpoint_;
  std::optional<std::string> auth_header_;
  int default_timeout_ms_;
  unsigned long long next_id_ = 1;
  std::unordered_map<std::string, std::string> default_headers_;
  std::string BuildPayload(const std::string& method, const std::vector<std::string>& params);
};
