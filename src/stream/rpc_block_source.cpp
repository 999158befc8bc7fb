#include "stream/rpc_block_source.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "utils/json_rpc.hpp"
#include <stdexcept>

using json = nlohmann::json;

RpcBlockSource::RpcBlockSource(std::unique_ptr<HttpClient> http,
                               const std::string& endpoint_url,
                               const std::optional<std::string>& auth_header,
                               int timeout_ms)
  : http_(std::move(http)) {
  if (!http_) throw std::invalid_argument("RpcBlockSource requires an HttpClient");
  if (endpoint_url.empty()) throw std::invalid_argument("RpcBlockSource requires an endpoint URL");
  rpc_.reset(new RpcClient(*http_, endpoint_url, auth_header, timeout_ms));
}

RpcBlockSource::~RpcBlockSource() = default;

FetchResult<BlockNumber> RpcBlockSource::LatestBlockNumber() {
  try {
    return FetchResult<BlockNumber>::Ok(JsonRpcUtil::ParseHexQuantity(rpc_->EthBlockNumber()));
  } catch (const std::exception& e) {
    return FetchResult<BlockNumber>::Failed(e.what());
  }
}

FetchResult<Block> RpcBlockSource::GetBlock(BlockNumber number) {
  try {
    auto body = rpc_->EthGetBlockByNumber(JsonRpcUtil::ToHexQuantity(number), false);
    return ParseBlock(JsonRpcUtil::ExtractResult(body), number);
  } catch (const std::exception& e) {
    return FetchResult<Block>::Failed(e.what());
  }
}

FetchResult<Block> RpcBlockSource::ParseBlock(const json& result, BlockNumber requested) {
  if (result.is_null()) {
    return FetchResult<Block>::NotFound("block " + std::to_string(requested) + " not found");
  }
  if (!result.is_object()) return FetchResult<Block>::Failed("block result is not an object");
  for (const char* field : {"number", "timestamp", "hash"}) {
    if (!result.contains(field) || !result[field].is_string()) {
      return FetchResult<Block>::Failed(std::string("block missing field '") + field + "'");
    }
  }
  if (!result.contains("transactions") || !result["transactions"].is_array()) {
    return FetchResult<Block>::Failed("block missing field 'transactions'");
  }
  try {
    Block block;
    block.number = JsonRpcUtil::ParseHexQuantity(result["number"].get<std::string>());
    block.timestamp = JsonRpcUtil::ParseHexQuantity(result["timestamp"].get<std::string>());
    block.hash = result["hash"].get<std::string>();
    if (block.number != requested) {
      return FetchResult<Block>::Failed("requested block " + std::to_string(requested) +
                                        " but provider returned " + std::to_string(block.number));
    }
    const auto& txs = result["transactions"];
    block.transactions.reserve(txs.size());
    for (const auto& tx : txs) {
      if (tx.is_string()) {
        block.transactions.push_back(tx.get<std::string>());
      } else if (tx.is_object() && tx.contains("hash") && tx["hash"].is_string()) {
        block.transactions.push_back(tx["hash"].get<std::string>());
      } else {
        return FetchResult<Block>::Failed("malformed transaction entry in block " + std::to_string(requested));
      }
    }
    return FetchResult<Block>::Ok(std::move(block));
  } catch (const std::exception& e) {
    return FetchResult<Block>::Failed(std::string("malformed block: ") + e.what());
  }
}
