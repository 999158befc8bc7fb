#include "stream/streaming_loop.hpp"
#include "common/logger.hpp"
#include <stdexcept>
#include <string>

static std::string SecondsString(std::chrono::milliseconds d) {
  auto whole = d.count() / 1000;
  auto frac = d.count() % 1000;
  if (frac == 0) return std::to_string(whole) + "s";
  std::string ms = std::to_string(frac);
  while (ms.size() < 3) ms.insert(ms.begin(), '0');
  return std::to_string(whole) + "." + ms + "s";
}

const char* CycleOutcomeToString(CycleOutcome outcome) {
  switch (outcome) {
    case CycleOutcome::ADVANCED: return "advanced";
    case CycleOutcome::IDLE: return "idle";
    case CycleOutcome::BLOCK_NOT_FOUND: return "block not found";
    case CycleOutcome::LATEST_FAILED: return "latest block failed";
    case CycleOutcome::FETCH_FAILED: return "block fetch failed";
    case CycleOutcome::STALLED: return "stalled";
  }
  return "unknown";
}

StreamingLoop::StreamingLoop(ProviderPool& pool,
                             StreamCursor& cursor,
                             BlockSink& sink,
                             const StreamingOptions& options,
                             LoopClock clock)
  : pool_(pool), cursor_(cursor), sink_(sink), options_(options), clock_(std::move(clock)) {
  if (!clock_.now || !clock_.sleep) throw std::invalid_argument("StreamingLoop requires a clock");
  if (options_.poll_interval.count() < 0 || options_.block_delay_threshold.count() < 0) {
    throw std::invalid_argument("StreamingLoop intervals must not be negative");
  }
}

bool StreamingLoop::Stalled() const {
  return clock_.now() - cursor_.last_block_time > options_.block_delay_threshold;
}

CycleReport StreamingLoop::Rotate(CycleOutcome outcome, const std::string& reason, size_t emitted) {
  pool_.RecordFailureAndRotate(reason);
  return CycleReport{outcome, emitted};
}

CycleReport StreamingLoop::RunCycle() {
  Provider& provider = pool_.Active();
  const std::string name = provider.name;

  auto latest = provider.client->LatestBlockNumber();
  if (!latest.ok()) {
    Logger::Error("Failed to fetch latest block from " + name + ": " + latest.error);
    return Rotate(CycleOutcome::LATEST_FAILED, "latest block number " +
                  std::string(FetchStatusToString(latest.status)) + ": " + latest.error, 0);
  }
  const BlockNumber head = latest.value;

  if (!cursor_.Initialized()) {
    if (head > 0) cursor_.last_block = head - 1;
    cursor_.started = true;
    cursor_.last_block_time = clock_.now();
    Logger::Info("Starting block streaming at block " + std::to_string(head) + " (provider: " + name + ")");
  }

  const BlockNumber next = cursor_.NextBlock();
  if (head >= next) {
    size_t emitted = 0;
    for (BlockNumber n = next;; ++n) {
      auto fetched = provider.client->GetBlock(n);
      if (fetched.status == FetchStatus::NOT_FOUND) {
        Logger::Warning("Block " + std::to_string(n) + " missing from " + name +
                        " (head " + std::to_string(head) + "): " + fetched.error);
        if (emitted == 0 && Stalled()) {
          return Rotate(CycleOutcome::STALLED, "no progress on block " + std::to_string(next) +
                        " for more than " + SecondsString(options_.block_delay_threshold), 0);
        }
        return CycleReport{CycleOutcome::BLOCK_NOT_FOUND, emitted};
      }
      if (fetched.status == FetchStatus::FAILED || fetched.value.number != n) {
        std::string why = fetched.status == FetchStatus::FAILED
            ? fetched.error
            : "returned block " + std::to_string(fetched.value.number);
        Logger::Error("Error retrieving block " + std::to_string(n) + " from " + name + ": " + why);
        return Rotate(CycleOutcome::FETCH_FAILED, "block " + std::to_string(n) + " fetch failed: " + why, emitted);
      }

      sink_.Emit(fetched.value, name);
      cursor_.last_block = n;
      cursor_.last_block_time = clock_.now();
      ++emitted;
      if (n == head) break;
    }
    return CycleReport{CycleOutcome::ADVANCED, emitted};
  }

  if (head + 1 < next) {
    Logger::Debug("Provider " + name + " is behind: head " + std::to_string(head) +
                  ", next block " + std::to_string(next));
  }
  if (Stalled()) {
    Logger::Warning("No new block for " + SecondsString(options_.block_delay_threshold) + " from " + name +
                    ". Triggering failover.");
    return Rotate(CycleOutcome::STALLED, "no block " + std::to_string(next) + " yet", 0);
  }
  return CycleReport{CycleOutcome::IDLE, 0};
}

CycleReport StreamingLoop::Step() {
  CycleReport report = RunCycle();
  if (!report.Rotated()) clock_.sleep(options_.poll_interval);
  return report;
}

void StreamingLoop::Run(const std::function<bool()>& keep_running) {
  while (keep_running()) {
    try {
      Step();
    } catch (const std::exception& e) {
      Logger::Error(std::string("Streaming cycle aborted: ") + e.what());
      clock_.sleep(options_.poll_interval);
    }
  }
  if (cursor_.last_block) {
    Logger::Info("Block streaming stopped at block " + std::to_string(*cursor_.last_block));
  }
}
