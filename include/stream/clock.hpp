#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// Stop request shared by every wait of the process. Waits return as soon
// as a stop is requested.
class StopSignal {
public:
  void RequestStop();
  bool StopRequested() const { return stopped_.load(std::memory_order_acquire); }
  // Returns false if the wait was cut short by a stop request.
  bool WaitFor(std::chrono::milliseconds d);
private:
  std::atomic<bool> stopped_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

// Time source and the only suspension primitive used by the pool and loop.
struct LoopClock {
  std::function<std::chrono::steady_clock::time_point()> now;
  SleepFn sleep;

  // Wall-clock steady time. With a StopSignal, sleeps end early on stop.
  static LoopClock System(StopSignal* stop = nullptr);
};
