#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace x1memo::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Throws std::runtime_error for anything other than debug/info/warn/warning/error.
LogLevel ParseLogLevelString(const std::string& value);

// Process-wide threshold; lines below it are dropped.
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

// Mirrors every emitted line into |path| in addition to stderr. The file is
// rotated to path.1 .. path.<max_files> once it grows past |max_bytes|
// (0 disables rotation).
void EnableLogFile(const std::string& path, std::uintmax_t max_bytes = 0,
                   std::size_t max_files = 0);
void DisableLogFile();

void Log(LogLevel level, std::string_view component, const std::string& message);

inline void LogDebug(std::string_view component, const std::string& message) {
  Log(LogLevel::kDebug, component, message);
}
inline void LogInfo(std::string_view component, const std::string& message) {
  Log(LogLevel::kInfo, component, message);
}
inline void LogWarn(std::string_view component, const std::string& message) {
  Log(LogLevel::kWarn, component, message);
}
inline void LogError(std::string_view component, const std::string& message) {
  Log(LogLevel::kError, component, message);
}

}  // namespace x1memo::util
