#pragma once

#include <cstdint>
#include <string>

namespace footprint {

// Process-wide levelled logging to std::cerr (and therefore into LogTee when enabled).
//
// Output format:
//   [footprint:INFO] cleaner: 12 segments after dedup
//
// Messages are formatted and written under a mutex so concurrent batch workers do not
// interleave lines.

enum class LogLevel : std::uint8_t {
  Trace = 0,
  Debug = 1,
  Info = 2,
  Warn = 3,
  Error = 4,
  None = 5,
};

// Parse a user-facing string into a log level.
//
// Accepted values (case-insensitive):
//   trace, debug, info, warn, warning, error, none, off, quiet
//
// Returns `fallback` if `s` is not recognized.
LogLevel ParseLogLevel(const std::string& s, LogLevel fallback);

const char* LogLevelName(LogLevel level);

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

inline bool LogEnabled(LogLevel level)
{
  return level != LogLevel::None && static_cast<int>(level) >= static_cast<int>(GetLogLevel());
}

// Apply FOOTPRINT_LOG_LEVEL from the environment if it is set and valid.
// Returns true if the variable was applied.
bool ApplyLogLevelFromEnv();

void LogMessage(LogLevel level, const char* channel, const std::string& message);

// printf-style convenience wrapper. Messages longer than 4 KiB are truncated.
void Logf(LogLevel level, const char* channel, const char* fmt, ...);

} // namespace footprint
