#include "lrc/math/TimeTicks.hpp"
#include <cmath>

namespace lrc {

std::int64_t durationSeconds(HistoryDuration d) {
  switch (d) {
    case HistoryDuration::Hour:  return 3600;
    case HistoryDuration::Day:   return 86400;
    case HistoryDuration::Week:  return 7 * 86400;
    case HistoryDuration::Month: return 30 * 86400;
    case HistoryDuration::Year:  return 365 * 86400;
    default:                     return 30 * 86400;
  }
}

std::vector<std::int64_t> generateTimeTicks(std::int64_t from, std::int64_t to, int count) {
  std::vector<std::int64_t> out;
  if (count < 1) return out;
  if (to <= from || count == 1) {
    out.push_back(from);
    return out;
  }

  double span = static_cast<double>(to - from);
  out.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; i++) {
    double t = static_cast<double>(from) + span * i / (count - 1);
    out.push_back(static_cast<std::int64_t>(std::llround(t)));
  }
  return out;
}

} // namespace lrc
