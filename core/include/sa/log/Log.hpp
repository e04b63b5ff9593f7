#pragma once
#include <string>

namespace sa {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void setLogLevel(LogLevel level);

// Accepts "debug", "info", "warn", "error". Returns false otherwise.
bool parseLogLevel(const std::string& text, LogLevel& out);
const char* logLevelName(LogLevel level);

// printf-style line on stderr: "[tag] message\n". Lines below the
// current level are dropped before formatting.
void logf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#define SA_LOG_DEBUG(tag, ...) ::sa::logf(::sa::LogLevel::Debug, tag, __VA_ARGS__)
#define SA_LOG_INFO(tag, ...)  ::sa::logf(::sa::LogLevel::Info, tag, __VA_ARGS__)
#define SA_LOG_WARN(tag, ...)  ::sa::logf(::sa::LogLevel::Warn, tag, __VA_ARGS__)
#define SA_LOG_ERROR(tag, ...) ::sa::logf(::sa::LogLevel::Error, tag, __VA_ARGS__)

} // namespace sa
