#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace ctwallet::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Throws std::invalid_argument on unknown names.
LogLevel ParseLogLevel(std::string_view value);

// Process-wide log sink. Lines go to the optional log file; warnings and
// errors are echoed to stderr as "[component] warn: message".
class Logger {
 public:
  void EnableFile(const std::string& path);
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void SetStderrEcho(bool enabled);
  void Log(LogLevel level, std::string_view component, std::string_view message);
  bool ShouldLog(LogLevel level) const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
  bool stderr_echo_{true};
};

Logger& GetLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

}  // namespace ctwallet::util
