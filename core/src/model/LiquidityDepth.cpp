#include "lrc/model/LiquidityDepth.hpp"
#include "lrc/model/TickMath.hpp"
#include <algorithm>
#include <cmath>

namespace lrc {

std::vector<TickEntry> buildTickEntries(const std::vector<RawTick>& raw, bool invert) {
  std::vector<RawTick> sorted;
  sorted.reserve(raw.size());
  for (const auto& r : raw) {
    if (std::isfinite(r.liquidityNet)) sorted.push_back(r);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RawTick& a, const RawTick& b) { return a.tickIdx < b.tickIdx; });

  std::vector<TickEntry> out;
  out.reserve(sorted.size());
  double cumulative = 0;
  for (const auto& r : sorted) {
    cumulative += r.liquidityNet;
    double p = tickToPrice(r.tickIdx);
    if (!std::isfinite(p) || p <= 0.0) continue;

    TickEntry e;
    e.tick = r.tickIdx;
    e.price0 = invert ? 1.0 / p : p;
    e.price1 = invert ? p : 1.0 / p;
    e.activeLiquidity = std::max(0.0, cumulative);
    out.push_back(e);
  }

  if (invert) std::reverse(out.begin(), out.end());
  return out;
}

double liquidityAtTick(const std::vector<RawTick>& raw, int tick) {
  double sum = 0;
  for (const auto& r : raw) {
    if (r.tickIdx <= tick && std::isfinite(r.liquidityNet)) sum += r.liquidityNet;
  }
  return std::max(0.0, sum);
}

std::vector<TickEntry> filterToVisibleRange(const std::vector<TickEntry>& entries,
                                            int minTick, int maxTick,
                                            double bufferPercent) {
  if (minTick > maxTick) std::swap(minTick, maxTick);
  double buffer = static_cast<double>(maxTick - minTick) * bufferPercent;
  double lo = minTick - buffer;
  double hi = maxTick + buffer;

  std::vector<TickEntry> out;
  for (const auto& e : entries) {
    if (e.tick >= lo && e.tick <= hi) out.push_back(e);
  }
  return out;
}

double maxLiquidity(const std::vector<TickEntry>& entries, double padding) {
  double m = 0;
  for (const auto& e : entries) m = std::max(m, e.activeLiquidity);
  if (m <= 0.0) return 1.0;
  return m * (1.0 + padding);
}

PriceBounds dataPriceBounds(const std::vector<TickEntry>& entries) {
  PriceBounds b;
  if (entries.empty()) return b;
  b.min = entries.front().price0;
  b.max = entries.front().price0;
  for (const auto& e : entries) {
    b.min = std::min(b.min, e.price0);
    b.max = std::max(b.max, e.price0);
  }
  return b;
}

PriceBounds priceSeriesBounds(const std::vector<PricePoint>& series) {
  PriceBounds b;
  if (series.empty()) return b;
  b.min = series.front().value;
  b.max = series.front().value;
  for (const auto& p : series) {
    b.min = std::min(b.min, p.value);
    b.max = std::max(b.max, p.value);
  }
  return b;
}

} // namespace lrc
