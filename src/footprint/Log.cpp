#include "footprint/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>

namespace footprint {

namespace {

std::mutex g_mutex;
std::atomic<int> g_minLevel{static_cast<int>(LogLevel::Warn)};

std::string ToLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void WriteLineLocked(LogLevel level, const char* channel, const char* text)
{
  const std::size_t len = text ? std::strlen(text) : 0;
  const bool hasNl = (len > 0 && text[len - 1] == '\n');

  std::ostream& os = std::cerr;
  os << "[footprint:" << LogLevelName(level) << "] ";
  if (channel && channel[0]) os << channel << ": ";
  os << (len > 0 ? text : "(empty)");
  if (!hasNl) os << "\n";
  os.flush();
}

} // namespace

LogLevel ParseLogLevel(const std::string& s, LogLevel fallback)
{
  const std::string k = ToLower(s);
  if (k == "trace" || k == "all") return LogLevel::Trace;
  if (k == "debug") return LogLevel::Debug;
  if (k == "info") return LogLevel::Info;
  if (k == "warn" || k == "warning") return LogLevel::Warn;
  if (k == "error") return LogLevel::Error;
  if (k == "none" || k == "off" || k == "quiet") return LogLevel::None;
  return fallback;
}

const char* LogLevelName(LogLevel level)
{
  switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::None: return "NONE";
    default: return "LOG";
  }
}

void SetLogLevel(LogLevel level)
{
  g_minLevel.store(static_cast<int>(level));
}

LogLevel GetLogLevel()
{
  return static_cast<LogLevel>(g_minLevel.load());
}

bool ApplyLogLevelFromEnv()
{
  const char* env = std::getenv("FOOTPRINT_LOG_LEVEL");
  if (!env || !env[0]) return false;

  // Use an out-of-range sentinel to detect unrecognized values.
  const LogLevel sentinel = static_cast<LogLevel>(0xFF);
  const LogLevel lvl = ParseLogLevel(env, sentinel);
  if (lvl == sentinel) return false;
  SetLogLevel(lvl);
  return true;
}

void LogMessage(LogLevel level, const char* channel, const std::string& message)
{
  if (!LogEnabled(level)) return;
  std::scoped_lock<std::mutex> lock(g_mutex);
  WriteLineLocked(level, channel, message.c_str());
}

void Logf(LogLevel level, const char* channel, const char* fmt, ...)
{
  if (!LogEnabled(level)) return;

  char buf[4096];
  buf[0] = '\0';
  if (fmt) {
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
  }

  std::scoped_lock<std::mutex> lock(g_mutex);
  WriteLineLocked(level, channel, buf);
}

} // namespace footprint
