#include "util/log.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace x1memo::util {

namespace {

std::string FormatTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &time);
#else
  localtime_r(&time, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

class Logger {
 public:
  void SetThreshold(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
  }

  LogLevel Threshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threshold_;
  }

  void EnableFile(const std::string& path, std::uintmax_t max_bytes, std::size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
      stream_.close();
    }
    path_ = path;
    max_bytes_ = max_bytes;
    max_files_ = max_files;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
      std::error_code ec;
      std::filesystem::create_directories(parent, ec);
    }
    stream_.open(path, std::ios::app);
    if (!stream_) {
      throw std::runtime_error("failed to open log file: " + path);
    }
    current_size_ = 0;
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec) {
      current_size_ = size;
    }
  }

  void DisableFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_.is_open()) {
      stream_.close();
    }
    path_.clear();
  }

  void Write(LogLevel level, std::string_view component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(threshold_)) {
      return;
    }
    std::ostringstream line;
    line << "[" << FormatTimestamp() << "] [" << LogLevelName(level) << "] [" << component
         << "] " << message << '\n';
    const std::string text = line.str();
    std::cerr << text;
    if (!stream_.is_open()) {
      return;
    }
    if (max_bytes_ > 0 && current_size_ >= max_bytes_) {
      RotateLocked();
    }
    stream_ << text;
    stream_.flush();
    current_size_ += static_cast<std::uintmax_t>(text.size());
  }

 private:
  void RotateLocked() {
    if (path_.empty() || max_bytes_ == 0 || max_files_ == 0) {
      return;
    }
    stream_.close();
    for (std::size_t i = max_files_; i > 0; --i) {
      std::filesystem::path rotated =
          std::filesystem::path(path_).concat("." + std::to_string(i));
      std::filesystem::path previous =
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

  mutable std::mutex mutex_;
  LogLevel threshold_{LogLevel::kInfo};
  std::ofstream stream_;
  std::string path_;
  std::uintmax_t max_bytes_{0};
  std::size_t max_files_{0};
  std::uintmax_t current_size_{0};
};

Logger& GetLogger() {
  static Logger logger;
  return logger;
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

LogLevel ParseLogLevelString(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "debug") {
    return LogLevel::kDebug;
  }
  if (lower == "info") {
    return LogLevel::kInfo;
  }
  if (lower == "warn" || lower == "warning") {
    return LogLevel::kWarn;
  }
  if (lower == "error") {
    return LogLevel::kError;
  }
  throw std::runtime_error("invalid log level: " + value);
}

void SetLogLevel(LogLevel level) { GetLogger().SetThreshold(level); }

LogLevel GetLogLevel() { return GetLogger().Threshold(); }

void EnableLogFile(const std::string& path, std::uintmax_t max_bytes, std::size_t max_files) {
  GetLogger().EnableFile(path, max_bytes, max_files);
}

void DisableLogFile() { GetLogger().DisableFile(); }

void Log(LogLevel level, std::string_view component, const std::string& message) {
  GetLogger().Write(level, component, message);
}

}  // namespace x1memo::util
