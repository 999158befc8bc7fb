#pragma once
#include "stream/block_source.hpp"
#include "stream/clock.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// How to reach one provider. Either `source` is already set, or the pool's
// resolver turns `url`/`auth_header` into a client.
struct ProviderSpec {
  std::string name;
  std::string url;
  std::optional<std::string> auth_header;
  std::shared_ptr<BlockSource> source;
};

struct Provider {
  std::string name;
  std::shared_ptr<BlockSource> client;
};

using ProviderResolver = std::function<std::shared_ptr<BlockSource>(const ProviderSpec&)>;

// Every configured provider failed its liveness probe.
class NoWorkingProvidersError : public std::runtime_error {
public:
  explicit NoWorkingProvidersError(size_t attempted);
  size_t Attempted() const { return attempted_; }
private:
  size_t attempted_;
};

// Ordered set of providers with one active at a time. Failure counts are
// kept per provider name for the lifetime of the pool and are never reset.
class ProviderPool {
public:
  static constexpr std::chrono::seconds DEFAULT_BACKOFF_CAP{300};

  // Resolves and probes each spec once; providers that fail are dropped.
  // Throws std::invalid_argument on an empty list and
  // NoWorkingProvidersError when nothing survives the probe.
  ProviderPool(const std::vector<ProviderSpec>& specs,
               const ProviderResolver& resolve,
               std::chrono::seconds backoff_cap = DEFAULT_BACKOFF_CAP,
               SleepFn sleep = nullptr);

  Provider& Active() { return providers_[index_]; }
  const Provider& Active() const { return providers_[index_]; }
  size_t ActiveIndex() const { return index_; }
  size_t Size() const { return providers_.size(); }
  const std::vector<Provider>& Providers() const { return providers_; }
  unsigned FailureCount(const std::string& name) const;

  // Charges a failure to the active provider, sleeps min(2^failures, cap)
  // seconds, then makes the next provider (cyclically) active. Returns the
  // delay that was slept.
  std::chrono::seconds RecordFailureAndRotate(const std::string& reason);

  static std::chrono::seconds BackoffDelay(unsigned failures, std::chrono::seconds cap);

private:
  std::vector<Provider> providers_;
  size_t index_ = 0;
  std::unordered_map<std::string, unsigned> failures_;
  std::chrono::seconds backoff_cap_;
  SleepFn sleep_;
};
