#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <vector>

// Key/value configuration from a .env file, overridden by process environment.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  // Replaces the file-backed values; used by tests.
  static void SetForTesting(const std::unordered_map<std::string, std::string>& values);
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static double GetDoubleOr(const std::string& key, double default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Comma separated list, entries trimmed, empty entries dropped.
  static std::vector<std::string> GetList(const std::string& key);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static bool use_environment_;
  static void LoadEnvFile(const std::string& env_path);
};
