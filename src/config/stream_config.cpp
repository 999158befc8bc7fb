#include "config/stream_config.hpp"
#include "common/config_manager.hpp"
#include <cmath>
#include <stdexcept>

static std::chrono::milliseconds SecondsToMs(const std::string& key, double seconds) {
  if (!(seconds > 0) || !std::isfinite(seconds)) {
    throw std::runtime_error("Config " + key + " must be a positive number of seconds");
  }
  return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

StreamConfig LoadStreamConfig() {
  StreamConfig cfg;

  const auto urls = ConfigManager::GetList("PROVIDER_URLS");
  if (urls.empty()) throw std::runtime_error("Missing required config: PROVIDER_URLS");
  const auto names = ConfigManager::GetList("PROVIDER_NAMES");
  if (!names.empty() && names.size() != urls.size()) {
    throw std::runtime_error("PROVIDER_NAMES has " + std::to_string(names.size()) +
                             " entries but PROVIDER_URLS has " + std::to_string(urls.size()));
  }
  const auto auths = ConfigManager::GetList("PROVIDER_AUTH_HEADERS");
  if (auths.size() > 1 && auths.size() != urls.size()) {
    throw std::runtime_error("PROVIDER_AUTH_HEADERS must have one entry or one per provider URL");
  }
  for (size_t i = 0; i < urls.size(); ++i) {
    ProviderEndpoint ep;
    ep.name = names.empty() ? "Provider" + std::to_string(i + 1) : names[i];
    ep.url = urls[i];
    if (!auths.empty()) ep.auth_header = auths.size() == 1 ? auths[0] : auths[i];
    cfg.providers.push_back(ep);
  }

  cfg.poll_interval = SecondsToMs("POLL_INTERVAL_S", ConfigManager::GetDoubleOr("POLL_INTERVAL_S", 5.0));
  cfg.block_delay_threshold = SecondsToMs("BLOCK_DELAY_THRESHOLD_S",
                                          ConfigManager::GetDoubleOr("BLOCK_DELAY_THRESHOLD_S", 60.0));
  const int cap = ConfigManager::GetIntOr("BACKOFF_CAP_S", 300);
  if (cap < 1) throw std::runtime_error("Config BACKOFF_CAP_S must be at least 1");
  cfg.backoff_cap = std::chrono::seconds(cap);
  cfg.rpc_timeout_ms = ConfigManager::GetIntOr("RPC_TIMEOUT_MS", 10000);
  if (cfg.rpc_timeout_ms <= 0) throw std::runtime_error("Config RPC_TIMEOUT_MS must be positive");

  cfg.verify_tls = ConfigManager::GetBoolOr("HTTP_VERIFY_TLS", true);
  cfg.emit_transaction_hashes = ConfigManager::GetBoolOr("EMIT_TRANSACTION_HASHES", true);
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or("");
  cfg.log_to_console = ConfigManager::GetBoolOr("LOG_TO_CONSOLE", cfg.log_file.empty());
  cfg.log_level = ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info"));
  cfg.block_log_file = ConfigManager::Get("BLOCK_LOG_FILE").value_or("");
  return cfg;
}
