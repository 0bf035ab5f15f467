#include "lrc/scale/CoordinateTransform.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace lrc {

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

CoordinateTransform::CoordinateTransform(const std::vector<TickEntry>& ticks,
                                         const TickScale& scale)
  : ticks_(ticks), scale_(scale) {}

bool CoordinateTransform::ready() const {
  return !ticks_.empty() && scale_.size() == ticks_.size();
}

double CoordinateTransform::alignmentOffset(TickAlignment align) const {
  switch (align) {
    case TickAlignment::Top:    return 0.0;
    case TickAlignment::Bottom: return scale_.bandwidth();
    case TickAlignment::Center:
    default:                    return scale_.bandwidth() * 0.5;
  }
}

double CoordinateTransform::priceToY(double price, TickAlignment align) const {
  if (!ready() || !std::isfinite(price)) return kNaN;

  const std::size_t n = ticks_.size();
  const double off = alignmentOffset(align);
  const double lo = ticks_.front().price0;
  const double hi = ticks_.back().price0;

  if (n == 1 || !(hi > lo)) return scale_.bandY(0) + off;

  if (price <= lo || price >= hi) {
    double slope = (scale_.bandY(n - 1) - scale_.bandY(0)) / (hi - lo);
    if (price <= lo) return scale_.bandY(0) + (price - lo) * slope + off;
    // first band carrying the top price (duplicates share a price)
    auto it = std::lower_bound(ticks_.begin(), ticks_.end(), hi,
                               [](const TickEntry& e, double p) { return e.price0 < p; });
    std::size_t top = static_cast<std::size_t>(it - ticks_.begin());
    return scale_.bandY(top) + (price - hi) * slope + off;
  }

  auto it = std::lower_bound(ticks_.begin(), ticks_.end(), price,
                             [](const TickEntry& e, double p) { return e.price0 < p; });
  std::size_t j = static_cast<std::size_t>(it - ticks_.begin());
  if (ticks_[j].price0 == price) return scale_.bandY(j) + off;

  double p0 = ticks_[j - 1].price0;
  double p1 = ticks_[j].price0;
  double t = (price - p0) / (p1 - p0);
  double y0 = scale_.bandY(j - 1);
  double y1 = scale_.bandY(j);
  return y0 + t * (y1 - y0) + off;
}

double CoordinateTransform::yToPrice(double y, TickAlignment align) const {
  if (!ready() || !std::isfinite(y) || scale_.step() <= 0.0) return kNaN;

  const std::size_t n = ticks_.size();
  const double lo = ticks_.front().price0;
  const double hi = ticks_.back().price0;
  if (!(hi > lo)) return kNaN;

  double f = scale_.fractionalIndexAtTop(y - alignmentOffset(align));
  f = std::clamp(f, 0.0, static_cast<double>(n - 1));

  std::size_t i = static_cast<std::size_t>(std::floor(f));
  if (i >= n - 1) return ticks_[n - 1].price0;
  double t = f - static_cast<double>(i);
  return ticks_[i].price0 + t * (ticks_[i + 1].price0 - ticks_[i].price0);
}

PriceBounds CoordinateTransform::dataBounds() const {
  PriceBounds b;
  if (ticks_.empty()) return b;
  b.min = ticks_.front().price0;
  b.max = ticks_.back().price0;
  return b;
}

int findClosestTickIndex(const std::vector<TickEntry>& ticks, double price) {
  if (ticks.empty()) return -1;
  int best = 0;
  double bestDist = std::abs(ticks[0].price0 - price);
  for (std::size_t i = 1; i < ticks.size(); i++) {
    double d = std::abs(ticks[i].price0 - price);
    if (d < bestDist) {
      bestDist = d;
      best = static_cast<int>(i);
    }
  }
  return best;
}

const TickEntry* findClosestTick(const std::vector<TickEntry>& ticks, double price) {
  int idx = findClosestTickIndex(ticks, price);
  return idx < 0 ? nullptr : &ticks[static_cast<std::size_t>(idx)];
}

} // namespace lrc
