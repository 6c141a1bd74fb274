#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace qc {

// Bottom axis labels, always rendered in UTC: "03-14 09:30".
inline constexpr const char* kAxisTimeFormat = "%m-%d %H:%M";

// Log lines and request summaries.
inline constexpr const char* kLogTimeFormat = "%Y-%m-%d %H:%M:%S";

// Format an epoch-milliseconds timestamp using strftime.
// Negative values are floored to whole seconds (pre-1970 inputs).
inline std::string formatTimestampMs(std::int64_t epochMs, const char* fmt, bool utc = true) {
  std::int64_t secs = epochMs / 1000;
  if (epochMs < 0 && (epochMs % 1000) != 0) secs -= 1;
  auto epoch = static_cast<std::time_t>(secs);
  std::tm tm{};
  if (utc) {
#ifdef _WIN32
    gmtime_s(&tm, &epoch);
#else
    gmtime_r(&epoch, &tm);
#endif
  } else {
#ifdef _WIN32
    localtime_s(&tm, &epoch);
#else
    localtime_r(&epoch, &tm);
#endif
  }
  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

} // namespace qc
