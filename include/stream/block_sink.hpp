#pragma once
#include "stream/block.hpp"
#include <string>

// Receives every block exactly once, in order.
class BlockSink {
public:
  virtual ~BlockSink() = default;
  virtual void Emit(const Block& block, const std::string& provider_name) = 0;
};

// One JSON object per block:
// {"block_number","timestamp","hash","provider","transactions"|"transaction_count"}
std::string FormatBlockRecord(const Block& block, const std::string& provider_name, bool include_tx_hashes);

// Writes records through StructuredLogger and mirrors them to the process log.
class JsonlBlockSink : public BlockSink {
public:
  explicit JsonlBlockSink(bool include_tx_hashes = true) : include_tx_hashes_(include_tx_hashes) {}
  void Emit(const Block& block, const std::string& provider_name) override;
private:
  bool include_tx_hashes_;
};
