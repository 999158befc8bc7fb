#pragma once
#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <chrono>
#include <queue>
#include <thread>
#include <condition_variable>

enum class LogLevel { DEBUG, INFO, WARNING, ERROR, CRITICAL };

// Parses "debug", "info", "warning"/"warn", "error", "critical" (any case).
// Unknown names yield the fallback.
LogLevel ParseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

struct LogEntry {
  std::chrono::system_clock::time_point timestamp;
  LogLevel level;
  std::string message;
};

struct LoggerOptions {
  std::string file_path;         // empty: no file sink
  bool to_console = true;        // mirror to stderr
  LogLevel min_level = LogLevel::INFO;
};

// Process-wide asynchronous logger. Calls made before Initialize() are dropped.
class Logger {
  static std::unique_ptr<Logger> instance_;
  static std::mutex instance_mutex_;
  std::ofstream log_file_;
  bool to_console_ = true;
  std::mutex log_mutex_;
  std::queue<LogEntry> log_queue_;
  std::thread worker_thread_;
  std::condition_variable cv_;
  bool running_ = false;
  LogLevel min_level_ = LogLevel::INFO;
  Logger() = default;
  void WorkerFunction();
  void WriteLogEntry(const LogEntry&);
public:
  static void Initialize(const LoggerOptions& options);
  static void Shutdown();
  static bool IsEnabled(LogLevel level);
  static void Log(LogLevel level, const std::string& message);
  static void Debug(const std::string& m);
  static void Info(const std::string& m);
  static void Warning(const std::string& m);
  static void Error(const std::string& m);
  static void Critical(const std::string& m);
  static std::string FormatLogEntry(const LogEntry&);
  static std::string LevelToString(LogLevel);
  ~Logger();
};
