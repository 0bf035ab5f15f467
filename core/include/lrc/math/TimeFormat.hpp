#pragma once
#include "lrc/model/ChartTypes.hpp"
#include <cstdint>
#include <ctime>
#include <string>

namespace lrc {

// strftime pattern for time-axis labels: clock time within a day, calendar
// day within a month, month and year beyond that.
inline const char* chooseDurationFormat(HistoryDuration d) {
  if (d == HistoryDuration::Hour || d == HistoryDuration::Day) return "%H:%M";
  if (d == HistoryDuration::Year) return "%b %Y";
  return "%b %d";
}

// Labels are rendered in UTC unless the config asks for local time.
inline std::string formatTimestamp(std::int64_t epochSeconds, const char* fmt, bool utc = true) {
  const std::time_t t = static_cast<std::time_t>(epochSeconds);
  std::tm parts{};
#ifdef _WIN32
  if (utc) gmtime_s(&parts, &t); else localtime_s(&parts, &t);
#else
  if (utc) gmtime_r(&t, &parts); else localtime_r(&t, &parts);
#endif
  char out[48];
  const std::size_t n = std::strftime(out, sizeof(out), fmt, &parts);
  return std::string(out, n);
}

} // namespace lrc
