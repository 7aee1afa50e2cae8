#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace sealnode::util {

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

LogLevel ParseLogLevel(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") return LogLevel::kDebug;
  if (lower == "info") return LogLevel::kInfo;
  if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
  if (lower == "error") return LogLevel::kError;
  throw std::runtime_error("invalid log level: " + value);
}

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

void DebugLogger::Enable(const std::string& path) {
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
    throw std::runtime_error("failed to open debug log: " + path);
  }
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  current_size_ = ec ? 0 : size;
  const std::string header = "---- sealnoded log started " + FormatTimestamp() + " ----\n";
  stream_ << header;
  stream_.flush();
  current_size_ += header.size();
}

void DebugLogger::Configure(LogLevel level, std::uintmax_t max_bytes, std::size_t max_files) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_threshold_ = level;
  max_bytes_ = max_bytes;
  max_files_ = max_files;
}

void DebugLogger::Log(LogLevel level, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_.is_open() || static_cast<int>(level) < static_cast<int>(level_threshold_)) {
    return;
  }
  if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
    RotateLocked();
  }
  std::ostringstream line;
  line << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] " << message << '\n';
  const std::string text = line.str();
  stream_ << text;
  stream_.flush();
  current_size_ += text.size();
}

bool DebugLogger::Enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_.is_open();
}

void DebugLogger::RotateLocked() {
  if (path_.empty() || max_files_ == 0) {
    return;
  }
  stream_.close();
  for (std::size_t i = max_files_; i > 0; --i) {
    const std::filesystem::path rotated =
        std::filesystem::path(path_).concat("." + std::to_string(i));
    const std::filesystem::path previous =
        i == 1 ? std::filesystem::path(path_)
               : std::filesystem::path(path_).concat("." + std::to_string(i - 1));
    std::error_code ec;
    if (std::filesystem::exists(previous, ec)) {
      std::filesystem::rename(previous, rotated, ec);
    }
  }
  stream_.open(path_, std::ios::trunc);
  current_size_ = 0;
}

DebugLogger& GlobalLogger() {
  static DebugLogger logger;
  return logger;
}

void LogDebug(const std::string& message) { GlobalLogger().Log(LogLevel::kDebug, message); }

void LogInfo(const std::string& message) { GlobalLogger().Log(LogLevel::kInfo, message); }

void LogWarn(const std::string& tag, const std::string& message) {
  std::cerr << "[" << tag << "] warn: " << message << "\n";
  GlobalLogger().Log(LogLevel::kWarn, "[" + tag + "] " + message);
}

void LogError(const std::string& tag, const std::string& message) {
  std::cerr << "[" << tag << "] error: " << message << "\n";
  GlobalLogger().Log(LogLevel::kError, "[" + tag + "] " + message);
}

}  // namespace sealnode::util
