#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "config/stream_config.hpp"
#include "net/http_client.hpp"
#include "stream/block_sink.hpp"
#include "stream/clock.hpp"
#include "stream/provider_pool.hpp"
#include "stream/rpc_block_source.hpp"
#include "stream/streaming_loop.hpp"
#include "telemetry/structured_logger.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {
volatile std::sig_atomic_t g_stop = 0;

void HandleSignal(int) { g_stop = 1; }

// Forwards the signal flag to the StopSignal, which cannot be notified from
// inside a signal handler.
class SignalWatcher {
public:
  explicit SignalWatcher(StopSignal& stop) : stop_(stop), worker_([this]{ Run(); }) {}
  ~SignalWatcher() {
    stop_.RequestStop();
    if (worker_.joinable()) worker_.join();
  }
private:
  void Run() {
    while (!stop_.StopRequested()) {
      if (g_stop) {
        Logger::Info("Stop requested, finishing current cycle");
        stop_.RequestStop();
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
  StopSignal& stop_;
  std::thread worker_;
};

void ShutdownLogging() {
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
}
}

int main(int argc, char** argv) {
  const std::string env_path = argc > 1 ? argv[1] : ".env";
  // Console logger with defaults so configuration warnings are not lost.
  Logger::Initialize(LoggerOptions());
  try {
    ConfigManager::Initialize(env_path);
    StreamConfig cfg = LoadStreamConfig();

    LoggerOptions log_opts;
    log_opts.file_path = cfg.log_file;
    log_opts.to_console = cfg.log_to_console;
    log_opts.min_level = cfg.log_level;
    Logger::Shutdown();
    Logger::Initialize(log_opts);
    StructuredLogger::Instance().Initialize(cfg.block_log_file);

    StopSignal stop;
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    SignalWatcher watcher(stop);

    Logger::Info("Block streamer starting with " + std::to_string(cfg.providers.size()) + " provider(s)");

    HttpClientTuning http_tuning;
    http_tuning.verify_tls = cfg.verify_tls;

    std::vector<ProviderSpec> specs;
    for (const auto& ep : cfg.providers) {
      Logger::Info("  - " + ep.name + ": " + ep.url);
      specs.push_back(ProviderSpec{ep.name, ep.url, ep.auth_header, nullptr});
    }

    // Each provider owns its own HTTP handle.
    ProviderResolver resolve = [&](const ProviderSpec& spec) -> std::shared_ptr<BlockSource> {
      return std::make_shared<RpcBlockSource>(CreateCurlHttpClient(http_tuning), spec.url,
                                              spec.auth_header, cfg.rpc_timeout_ms);
    };

    LoopClock clock = LoopClock::System(&stop);
    ProviderPool pool(specs, resolve, cfg.backoff_cap, clock.sleep);

    StreamCursor cursor;
    JsonlBlockSink sink(cfg.emit_transaction_hashes);
    StreamingOptions options;
    options.poll_interval = cfg.poll_interval;
    options.block_delay_threshold = cfg.block_delay_threshold;

    StreamingLoop loop(pool, cursor, sink, options, clock);
    loop.Run([&stop]{ return !stop.StopRequested(); });

    Logger::Info("Block streamer shutdown complete");
    ShutdownLogging();
    return 0;
  } catch (const NoWorkingProvidersError& e) {
    Logger::Critical(std::string("Cannot start: ") + e.what());
    ShutdownLogging();
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    Logger::Critical(std::string("Fatal error: ") + e.what());
    ShutdownLogging();
    std::cerr << "CRITICAL ERROR: " << e.what() << std::endl;
    return 1;
  }
}
