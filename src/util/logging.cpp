#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ctwallet::util {

namespace {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

LogLevel ParseLogLevel(std::string_view value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") return LogLevel::kDebug;
  if (lower == "info") return LogLevel::kInfo;
  if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
  if (lower == "error") return LogLevel::kError;
  throw std::invalid_argument("invalid log level: " + std::string(value));
}

void Logger::EnableFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_.is_open()) {
    stream_.close();
  }
  path_ = path;
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  stream_.open(path, std::ios::app);
  if (!stream_) {
    throw std::runtime_error("failed to open log file: " + path);
  }
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  current_size_ = ec ? 0 : size;
}

void Logger::Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_threshold_ = level;
  max_bytes_ = max_bytes;
  max_files_ = max_files;
}

void Logger::SetStderrEcho(bool enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  stderr_echo_ = enabled;
}

bool Logger::ShouldLog(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(level) >= static_cast<int>(level_threshold_);
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_threshold_)) {
    return;
  }
  if (stderr_echo_ && level >= LogLevel::kWarn) {
    std::cerr << "[" << component << "] " << (level == LogLevel::kWarn ? "warn" : "error")
              << ": " << message << "\n";
  }
  if (!stream_.is_open()) {
    return;
  }
  if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
    RotateLocked();
  }
  std::ostringstream line;
  line << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] [" << component << "] "
       << message << '\n';
  const std::string text = line.str();
  stream_ << text;
  stream_.flush();
  current_size_ += static_cast<std::uintmax_t>(text.size());
}

void Logger::RotateLocked() {
  if (path_.empty() || max_bytes_ == 0 || max_files_ == 0) {
    return;
  }
  stream_.close();
  // ctwallet.log.(n-1) -> ctwallet.log.n
  for (std::size_t i = max_files_; i > 0; --i) {
    const auto rotated = std::filesystem::path(path_).concat("." + std::to_string(i));
    const auto previous =
        (i == 1) ? std::filesystem::path(path_)
                 : std::filesystem::path(path_).concat("." + std::to_string(i - 1));
    std::error_code ec;
    if (std::filesystem::exists(previous, ec)) {
      std::filesystem::rename(previous, rotated, ec);
    }
  }
  stream_.open(path_, std::ios::trunc);
  current_size_ = 0;
}

Logger& GetLogger() {
  static Logger logger;
  return logger;
}

void LogDebug(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kDebug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kInfo, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kWarn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
  GetLogger().Log(LogLevel::kError, component, message);
}

}  // namespace ctwallet::util
