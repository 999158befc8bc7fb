#pragma once
#include <cstdint>
#include <string>
#include <vector>

using BlockNumber = unsigned long long;

// A fully fetched block header as reported by a provider.
struct Block {
  BlockNumber number = 0;
  std::uint64_t timestamp = 0;            // seconds since epoch, as produced by the chain
  std::string hash;
  std::vector<std::string> transactions;  // transaction hashes

  size_t TransactionCount() const { return transactions.size(); }
};
