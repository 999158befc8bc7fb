#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>

std::unique_ptr<Logger> Logger::instance_;
std::mutex Logger::instance_mutex_;

static std::string TimeToString(const std::chrono::system_clock::time_point& tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf;
#if defined(_WIN32)
  localtime_s(&tm_buf, &t);
#else
  localtime_r(&t, &tm_buf);
#endif
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return std::string(buf);
}

LogLevel ParseLogLevel(const std::string& name, LogLevel fallback) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info") return LogLevel::INFO;
  if (s == "warning" || s == "warn") return LogLevel::WARNING;
  if (s == "error") return LogLevel::ERROR;
  if (s == "critical") return LogLevel::CRITICAL;
  return fallback;
}

void Logger::Initialize(const LoggerOptions& options) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (instance_) return;
  instance_.reset(new Logger());
  instance_->min_level_ = options.min_level;
  instance_->to_console_ = options.to_console;
  if (!options.file_path.empty()) {
    instance_->log_file_.open(options.file_path, std::ios::out | std::ios::app);
    if (!instance_->log_file_.is_open()) {
      std::cerr << "Failed to open log file: " << options.file_path << std::endl;
      instance_->to_console_ = true;
    }
  }
  instance_->running_ = true;
  instance_->worker_thread_ = std::thread(&Logger::WorkerFunction, instance_.get());
}

void Logger::Shutdown() {
  std::unique_ptr<Logger> inst;
  {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    inst = std::move(instance_);
  }
  if (!inst) return;
  {
    std::lock_guard<std::mutex> lock(inst->log_mutex_);
    inst->running_ = false;
  }
  inst->cv_.notify_all();
  if (inst->worker_thread_.joinable()) inst->worker_thread_.join();
  if (inst->log_file_.is_open()) inst->log_file_.close();
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(log_mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_thread_.joinable()) worker_thread_.join();
}

void Logger::WorkerFunction() {
  while (true) {
    std::unique_lock<std::mutex> lock(log_mutex_);
    cv_.wait(lock, [&]{ return !log_queue_.empty() || !running_; });
    if (!running_ && log_queue_.empty()) break;
    auto entry = log_queue_.front();
    log_queue_.pop();
    lock.unlock();
    WriteLogEntry(entry);
  }
}

std::string Logger::LevelToString(LogLevel l) {
  switch (l) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARNING";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::CRITICAL: return "CRITICAL";
  }
  return "UNKNOWN";
}

std::string Logger::FormatLogEntry(const LogEntry& e) {
  std::ostringstream oss;
  oss << TimeToString(e.timestamp) << " - " << LevelToString(e.level) << " - "
      << e.message << '\n';
  return oss.str();
}

void Logger::WriteLogEntry(const LogEntry& e) {
  std::string line = FormatLogEntry(e);
  if (log_file_.is_open()) {
    log_file_ << line;
    log_file_.flush();
  }
  if (to_console_) std::cerr << line << std::flush;
}

bool Logger::IsEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  return instance_ && level >= instance_->min_level_;
}

void Logger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(instance_mutex_);
  if (!instance_) return;
  if (level < instance_->min_level_) return;
  LogEntry e{std::chrono::system_clock::now(), level, message};
  {
    std::lock_guard<std::mutex> qlock(instance_->log_mutex_);
    instance_->log_queue_.push(std::move(e));
  }
  instance_->cv_.notify_one();
}

void Logger::Debug(const std::string& m) { Log(LogLevel::DEBUG, m); }
void Logger::Info(const std::string& m) { Log(LogLevel::INFO, m); }
void Logger::Warning(const std::string& m) { Log(LogLevel::WARNING, m); }
void Logger::Error(const std::string& m) { Log(LogLevel::ERROR, m); }
void Logger::Critical(const std::string& m) { Log(LogLevel::CRITICAL, m); }
