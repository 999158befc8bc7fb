#pragma once
#include "stream/block_source.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

class HttpClient;
class RpcClient;

// BlockSource over an Ethereum JSON-RPC endpoint (eth_blockNumber,
// eth_getBlockByNumber without full transactions).
class RpcBlockSource : public BlockSource {
public:
  // Owns the HTTP client; one transport per provider.
  RpcBlockSource(std::unique_ptr<HttpClient> http,
                 const std::string& endpoint_url,
                 const std::optional<std::string>& auth_header,
                 int timeout_ms);
  ~RpcBlockSource() override;

  FetchResult<BlockNumber> LatestBlockNumber() override;
  FetchResult<Block> GetBlock(BlockNumber number) override;

  // Converts an eth_getBlockByNumber "result" into a Block. Null means the
  // node does not have it; missing or malformed fields are a failure.
  static FetchResult<Block> ParseBlock(const nlohmann::json& result, BlockNumber requested);

private:
  std::unique_ptr<HttpClient> http_;
  std::unique_ptr<RpcClient> rpc_;
};
