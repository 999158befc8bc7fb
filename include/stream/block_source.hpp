#pragma once
#include "stream/block.hpp"
#include <string>
#include <utility>

enum class FetchStatus { OK, NOT_FOUND, FAILED };

const char* FetchStatusToString(FetchStatus status);

// Outcome of one provider call. `value` is meaningful only when status is OK.
template <typename T>
struct FetchResult {
  FetchStatus status = FetchStatus::FAILED;
  T value{};
  std::string error;

  static FetchResult Ok(T v) { return FetchResult{FetchStatus::OK, std::move(v), std::string()}; }
  static FetchResult NotFound(std::string why) { return FetchResult{FetchStatus::NOT_FOUND, T{}, std::move(why)}; }
  static FetchResult Failed(std::string why) { return FetchResult{FetchStatus::FAILED, T{}, std::move(why)}; }

  bool ok() const { return status == FetchStatus::OK; }
};

// What the streaming loop needs from a remote data provider. Calls block
// until the provider answers or the transport gives up; they never throw.
class BlockSource {
public:
  virtual ~BlockSource() = default;
  virtual FetchResult<BlockNumber> LatestBlockNumber() = 0;
  virtual FetchResult<Block> GetBlock(BlockNumber number) = 0;
};
