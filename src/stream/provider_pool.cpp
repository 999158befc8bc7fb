#include "stream/provider_pool.hpp"
#include "common/logger.hpp"
#include <algorithm>

NoWorkingProvidersError::NoWorkingProvidersError(size_t attempted)
  : std::runtime_error("no working providers (" + std::to_string(attempted) + " attempted)"),
    attempted_(attempted) {}

ProviderPool::ProviderPool(const std::vector<ProviderSpec>& specs,
                           const ProviderResolver& resolve,
                           std::chrono::seconds backoff_cap,
                           SleepFn sleep)
  : backoff_cap_(backoff_cap), sleep_(std::move(sleep)) {
  if (specs.empty()) throw std::invalid_argument("No providers configured");
  if (!sleep_) {
    sleep_ = LoopClock::System().sleep;
  }

  for (size_t i = 0; i < specs.size(); ++i) {
    const ProviderSpec& spec = specs[i];
    std::string name = spec.name.empty() ? "Provider" + std::to_string(i + 1) : spec.name;

    std::shared_ptr<BlockSource> client = spec.source;
    if (!client && resolve) {
      try {
        client = resolve(spec);
      } catch (const std::exception& e) {
        Logger::Warning("Dropping provider " + name + ": cannot create client: " + e.what());
        continue;
      }
    }
    if (!client) {
      Logger::Warning("Dropping provider " + name + ": no client available");
      continue;
    }

    auto probe = client->LatestBlockNumber();
    if (!probe.ok()) {
      Logger::Warning("Dropping provider " + name + ": liveness probe " +
                      FetchStatusToString(probe.status) + ": " + probe.error);
      continue;
    }
    Logger::Info("Provider " + name + " is live at block " + std::to_string(probe.value));
    bool duplicate = std::any_of(providers_.begin(), providers_.end(),
                                 [&](const Provider& p){ return p.name == name; });
    if (duplicate) Logger::Warning("Provider name " + name + " is used more than once; failures are shared");
    providers_.push_back(Provider{name, std::move(client)});
  }

  if (providers_.empty()) {
    Logger::Critical("No working providers out of " + std::to_string(specs.size()) + " configured");
    throw NoWorkingProvidersError(specs.size());
  }
}

unsigned ProviderPool::FailureCount(const std::string& name) const {
  auto it = failures_.find(name);
  return it == failures_.end() ? 0u : it->second;
}

std::chrono::seconds ProviderPool::BackoffDelay(unsigned failures, std::chrono::seconds cap) {
  if (failures >= 63) return cap;
  const unsigned long long delay = 1ULL << failures;
  if (delay >= static_cast<unsigned long long>(cap.count())) return cap;
  return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(delay));
}

std::chrono::seconds ProviderPool::RecordFailureAndRotate(const std::string& reason) {
  const std::string old_name = providers_[index_].name;
  unsigned failures = ++failures_[old_name];
  auto delay = BackoffDelay(failures, backoff_cap_);

  const size_t next = (index_ + 1) % providers_.size();
  Logger::Warning("Provider " + old_name + " unhealthy (" + reason + "), failure #" +
                  std::to_string(failures) + ", backing off " + std::to_string(delay.count()) + "s");
  sleep_(std::chrono::duration_cast<std::chrono::milliseconds>(delay));

  index_ = next;
  Logger::Warning("Switching provider from " + old_name + " to " + providers_[index_].name);
  return delay;
}
