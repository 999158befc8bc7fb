#include "stream/clock.hpp"
#include <thread>

void StopSignal::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool StopSignal::WaitFor(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !cv_.wait_for(lock, d, [this]{ return stopped_.load(std::memory_order_acquire); });
}

LoopClock LoopClock::System(StopSignal* stop) {
  LoopClock clock;
  clock.now = []{ return std::chrono::steady_clock::now(); };
  if (stop) {
    clock.sleep = [stop](std::chrono::milliseconds d){ if (d.count() > 0) stop->WaitFor(d); };
  } else {
    clock.sleep = [](std::chrono::milliseconds d){ if (d.count() > 0) std::this_thread::sleep_for(d); };
  }
  return clock;
}
