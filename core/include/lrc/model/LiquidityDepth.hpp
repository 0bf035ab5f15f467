#pragma once
#include "lrc/model/ChartTypes.hpp"
#include <vector>

namespace lrc {

// Initialized tick as reported by the pool: net liquidity change when the
// price crosses this tick upward.
struct RawTick {
  int tickIdx{0};
  double liquidityNet{0};
};

// Turn raw ticks into the ordered depth series the chart consumes.
// Sorted by tick, liquidityNet accumulated into activeLiquidity (clamped >= 0),
// price0 = 1.0001^tick and price1 = 1/price0. With `invert` the two prices
// swap roles. Output is ascending in price0. Non-finite entries are skipped.
std::vector<TickEntry> buildTickEntries(const std::vector<RawTick>& raw, bool invert = false);

// Active liquidity at `tick`: running sum of liquidityNet over every raw tick
// at or below it, clamped at 0.
double liquidityAtTick(const std::vector<RawTick>& raw, int tick);

// Keep entries whose tick lies inside [minTick, maxTick] widened on both sides
// by bufferPercent of the span.
std::vector<TickEntry> filterToVisibleRange(const std::vector<TickEntry>& entries,
                                            int minTick, int maxTick,
                                            double bufferPercent = 0.2);

// Largest activeLiquidity scaled up by `padding`; 1 for empty or all-zero input
// so it can be used as a divisor.
double maxLiquidity(const std::vector<TickEntry>& entries, double padding = 0.1);

// {min, max} of price0; {0, 0} when empty.
PriceBounds dataPriceBounds(const std::vector<TickEntry>& entries);

// {min, max} of the series values; {0, 0} when empty.
PriceBounds priceSeriesBounds(const std::vector<PricePoint>& series);

} // namespace lrc
