#pragma once
#include <cstdint>

namespace lrc {

// One discretized price bucket of the pool. Supplied by the host, never mutated.
struct TickEntry {
  int tick{0};
  double price0{0};
  double price1{0};
  double activeLiquidity{0};
};

// Historical price sample (unix seconds).
struct PricePoint {
  std::int64_t time{0};
  double value{0};
};

// Plot area in pixels, excluding the liquidity gutter.
struct Dimensions {
  double width{0};
  double height{0};
};

struct PriceBounds {
  double min{0};
  double max{0};
};

enum class HistoryDuration : std::uint8_t {
  Hour = 0,
  Day,
  Week,
  Month,
  Year
};

inline const char* toString(HistoryDuration d) {
  switch (d) {
    case HistoryDuration::Hour:  return "hour";
    case HistoryDuration::Day:   return "day";
    case HistoryDuration::Week:  return "week";
    case HistoryDuration::Month: return "month";
    case HistoryDuration::Year:  return "year";
    default: return "unknown";
  }
}

// Where inside a tick's band a price maps to.
enum class TickAlignment : std::uint8_t {
  Center = 0,
  Top,
  Bottom
};

enum class HandleType : std::uint8_t {
  Min = 0,
  Max,
  Center
};

} // namespace lrc
