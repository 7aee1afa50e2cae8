#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace sealnode::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);
// Throws std::runtime_error on unknown names.
LogLevel ParseLogLevel(const std::string& value);
std::string FormatTimestamp();

// Append-only debug log with size based rotation (log -> log.1 -> log.2 ...).
class DebugLogger {
 public:
  void Enable(const std::string& path);
  void Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files);
  void Log(LogLevel level, const std::string& message);
  bool Enabled() const;

 private:
  void RotateLocked();

  mutable std::mutex mutex_;
  std::ofstream stream_;
  std::string path_;
  LogLevel level_threshold_{LogLevel::kInfo};
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

DebugLogger& GlobalLogger();

void LogDebug(const std::string& message);
void LogInfo(const std::string& message);
// Warnings and errors are mirrored to stderr as "[tag] warn: ...".
void LogWarn(const std::string& tag, const std::string& message);
void LogError(const std::string& tag, const std::string& message);

}  // namespace sealnode::util
