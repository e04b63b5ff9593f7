#include "sa/log/Log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace sa {

static std::atomic<int> gLevel{static_cast<int>(LogLevel::Info)};
static std::mutex gLogMtx;

void setLogLevel(LogLevel level) { gLevel.store(static_cast<int>(level)); }

bool parseLogLevel(const std::string& text, LogLevel& out) {
  if (text == "debug") { out = LogLevel::Debug; return true; }
  if (text == "info")  { out = LogLevel::Info;  return true; }
  if (text == "warn")  { out = LogLevel::Warn;  return true; }
  if (text == "error") { out = LogLevel::Error; return true; }
  return false;
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "info";
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
  if (static_cast<int>(level) < gLevel.load()) return;

  char buf[1024];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);

  std::lock_guard<std::mutex> lock(gLogMtx);
  if (level >= LogLevel::Warn) {
    std::fprintf(stderr, "[%s] %s: %s\n", tag, logLevelName(level), buf);
  } else {
    std::fprintf(stderr, "[%s] %s\n", tag, buf);
  }
}

} // namespace sa
