#include "lrc/model/TickMath.hpp"
#include <algorithm>
#include <cmath>

namespace lrc {

double tickToPrice(int tick) {
  return std::pow(kTickBase, static_cast<double>(tick));
}

double tickToScaledPrice(int tick, int referenceTick, double referencePrice) {
  return referencePrice * std::pow(kTickBase, static_cast<double>(tick - referenceTick));
}

int priceToTick(double price) {
  if (!std::isfinite(price) || price <= 0.0) return kMinTick;
  double t = std::floor(std::log(price) / std::log(kTickBase));
  // log rounding can land one tick off for exact tick prices
  if (tickToPrice(static_cast<int>(t)) > price * (1.0 + 1e-12)) t -= 1.0;
  else if (tickToPrice(static_cast<int>(t) + 1) <= price * (1.0 + 1e-12)) t += 1.0;
  if (t < kMinTick) return kMinTick;
  if (t > kMaxTick) return kMaxTick;
  return static_cast<int>(t);
}

int nearestUsableTick(int tick, int spacing) {
  if (spacing <= 0) spacing = 1;
  double q = std::round(static_cast<double>(tick) / spacing);
  long long rounded = static_cast<long long>(q) * spacing;
  if (rounded < kMinTick) rounded += spacing;
  else if (rounded > kMaxTick) rounded -= spacing;
  return static_cast<int>(rounded);
}

TickRange fullRangeTicks(int spacing) {
  if (spacing <= 0) spacing = 1;
  TickRange r;
  r.lowerTick = static_cast<int>(std::ceil(static_cast<double>(kMinTick) / spacing)) * spacing;
  r.upperTick = static_cast<int>(std::floor(static_cast<double>(kMaxTick) / spacing)) * spacing;
  r.lowerPrice = tickToPrice(r.lowerTick);
  r.upperPrice = tickToPrice(r.upperTick);
  return r;
}

TickRange snapRangeToSpacing(double minPrice, double maxPrice, int spacing) {
  if (spacing <= 0) spacing = 1;
  if (minPrice > maxPrice) std::swap(minPrice, maxPrice);

  TickRange full = fullRangeTicks(spacing);
  TickRange r;
  r.lowerTick = std::clamp(nearestUsableTick(priceToTick(minPrice), spacing),
                           full.lowerTick, full.upperTick);
  r.upperTick = std::clamp(nearestUsableTick(priceToTick(maxPrice), spacing),
                           full.lowerTick, full.upperTick);

  if (r.upperTick <= r.lowerTick) {
    if (r.lowerTick + spacing <= full.upperTick) {
      r.upperTick = r.lowerTick + spacing;
    } else {
      r.upperTick = full.upperTick;
      r.lowerTick = full.upperTick - spacing;
    }
  }
  r.lowerPrice = tickToPrice(r.lowerTick);
  r.upperPrice = tickToPrice(r.upperTick);
  return r;
}

} // namespace lrc
