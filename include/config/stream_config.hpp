#pragma once
#include "common/logger.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct ProviderEndpoint {
  std::string name;
  std::string url;
  std::optional<std::string> auth_header;
};

struct StreamConfig {
  std::vector<ProviderEndpoint> providers;
  std::chrono::milliseconds poll_interval{5000};
  std::chrono::milliseconds block_delay_threshold{60000};
  std::chrono::seconds backoff_cap{300};
  int rpc_timeout_ms = 10000;
  bool verify_tls = true;
  bool emit_transaction_hashes = true;
  std::string log_file;          // empty: stderr only
  bool log_to_console = true;
  LogLevel log_level = LogLevel::INFO;
  std::string block_log_file;    // empty: stdout
};

// Builds the configuration from ConfigManager keys:
//   PROVIDER_URLS (required), PROVIDER_NAMES, PROVIDER_AUTH_HEADERS,
//   POLL_INTERVAL_S, BLOCK_DELAY_THRESHOLD_S, BACKOFF_CAP_S, RPC_TIMEOUT_MS,
//   HTTP_VERIFY_TLS, EMIT_TRANSACTION_HASHES, LOG_FILE, LOG_TO_CONSOLE,
//   LOG_LEVEL, BLOCK_LOG_FILE.
// Throws std::runtime_error on missing or inconsistent values.
StreamConfig LoadStreamConfig();
