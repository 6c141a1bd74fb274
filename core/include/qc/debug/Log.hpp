#pragma once
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <ctime>

namespace qc {

enum class LogLevel : std::uint8_t {
  Init,
  Ready,
  Info,
  Warn,
  Error
};

inline const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::Init:  return "INIT";
    case LogLevel::Ready: return "READY";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    default: return "?";
  }
}

// Console logging in the service's format:
//   [2024-05-01 14:30:15] [INFO] message
// Warn/Error go to stderr, everything else to stdout.
#if defined(__GNUC__)
__attribute__((format(printf, 2, 3)))
#endif
inline void logf(LogLevel level, const char* fmt, ...) {
  std::FILE* out = (level == LogLevel::Warn || level == LogLevel::Error) ? stderr : stdout;

  std::time_t now = std::time(nullptr);
  std::tm tm;
#ifdef _WIN32
  localtime_s(&tm, &now);
#else
  localtime_r(&now, &tm);
#endif
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

  std::fprintf(out, "[%s] [%s] ", stamp, toString(level));
  va_list args;
  va_start(args, fmt);
  std::vfprintf(out, fmt, args);
  va_end(args);
  std::fputc('\n', out);
  std::fflush(out);
}

} // namespace qc
