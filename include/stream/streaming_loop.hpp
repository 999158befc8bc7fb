#pragma once
#include "stream/block.hpp"
#include "stream/block_sink.hpp"
#include "stream/clock.hpp"
#include "stream/provider_pool.hpp"
#include <chrono>
#include <functional>
#include <optional>

// Watermark of what has been emitted. Owned by the caller, advanced only by
// StreamingLoop.
struct StreamCursor {
  std::optional<BlockNumber> last_block;      // empty until the first block is emitted
  std::chrono::steady_clock::time_point last_block_time{};
  bool started = false;                       // placed at a head, possibly before block 0

  bool Initialized() const { return started || last_block.has_value(); }
  BlockNumber NextBlock() const { return last_block ? *last_block + 1 : 0; }
};

struct StreamingOptions {
  std::chrono::milliseconds poll_interval{5000};
  std::chrono::milliseconds block_delay_threshold{60000};
};

enum class LoopState { UNINITIALIZED, POLLING };

enum class CycleOutcome {
  ADVANCED,          // at least the reported head was reached
  IDLE,              // nothing new, provider still within the delay threshold
  BLOCK_NOT_FOUND,   // provider announced a block it could not serve; retried next cycle
  LATEST_FAILED,     // rotated: head query failed
  FETCH_FAILED,      // rotated: block fetch failed
  STALLED            // rotated: no progress for longer than the delay threshold
};

const char* CycleOutcomeToString(CycleOutcome outcome);

struct CycleReport {
  CycleOutcome outcome = CycleOutcome::IDLE;
  size_t emitted = 0;

  bool Rotated() const {
    return outcome == CycleOutcome::LATEST_FAILED || outcome == CycleOutcome::FETCH_FAILED ||
           outcome == CycleOutcome::STALLED;
  }
};

// Polls the pool's active provider and emits new blocks in order, rotating
// providers on faults and stalls. Single-threaded: every provider call and
// every sleep blocks the caller.
class StreamingLoop {
public:
  StreamingLoop(ProviderPool& pool,
                StreamCursor& cursor,
                BlockSink& sink,
                const StreamingOptions& options,
                LoopClock clock = LoopClock::System());

  // One cycle without the trailing poll sleep.
  CycleReport RunCycle();
  // One cycle, then sleeps poll_interval unless the cycle rotated (the
  // rotation already backed off).
  CycleReport Step();
  // Steps until keep_running() returns false. Checked between cycles only.
  void Run(const std::function<bool()>& keep_running);

  LoopState State() const { return cursor_.Initialized() ? LoopState::POLLING : LoopState::UNINITIALIZED; }

private:
  bool Stalled() const;
  CycleReport Rotate(CycleOutcome outcome, const std::string& reason, size_t emitted);

  ProviderPool& pool_;
  StreamCursor& cursor_;
  BlockSink& sink_;
  StreamingOptions options_;
  LoopClock clock_;
};
