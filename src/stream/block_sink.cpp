#include "stream/block_sink.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <nlohmann/json.hpp>

std::string FormatBlockRecord(const Block& block, const std::string& provider_name, bool include_tx_hashes) {
  nlohmann::json j;
  j["block_number"] = block.number;
  j["timestamp"] = block.timestamp;
  j["hash"] = block.hash;
  if (include_tx_hashes) {
    j["transactions"] = block.transactions;
  } else {
    j["transaction_count"] = block.TransactionCount();
  }
  j["provider"] = provider_name;
  return j.dump();
}

void JsonlBlockSink::Emit(const Block& block, const std::string& provider_name) {
  std::string line = FormatBlockRecord(block, provider_name, include_tx_hashes_);
  StructuredLogger::Instance().LogJsonLine(line);
  Logger::Info(line);
}
