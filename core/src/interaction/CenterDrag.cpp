#include "lrc/interaction/CenterDrag.hpp"
#include "lrc/scale/CoordinateTransform.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace lrc {

CenterDrag::CenterDrag(const ChartReader& reader, ChartActions& actions)
  : reader_(reader), actions_(actions) {}

void CenterDrag::onStart(double, double y) {
  const auto& st = reader_.state();
  const auto& ticks = reader_.ticks();
  if (st.isFullRange || !st.hasRange() || ticks.empty()) {
    active_ = false;
    return;
  }

  const auto& xf = reader_.transform();
  double centerY = (xf.priceToY(st.maxPrice) + xf.priceToY(st.minPrice)) / 2.0;
  if (!std::isfinite(centerY)) {
    active_ = false;
    return;
  }

  grabOffsetY_ = y - centerY;
  int minIdx = findClosestTickIndex(ticks, st.minPrice);
  int maxIdx = findClosestTickIndex(ticks, st.maxPrice);
  tickSpan_ = std::abs(maxIdx - minIdx);
  active_ = true;
  actions_.setIsDragging(true);
}

bool CenterDrag::computeRange(double y, double& outMin, double& outMax) const {
  const auto& ticks = reader_.ticks();
  if (ticks.empty()) return false;

  double h = reader_.state().dimensions.height;
  double adjusted = std::clamp(y - grabOffsetY_, 0.0, h);
  double price = reader_.transform().yToPrice(adjusted);
  if (!std::isfinite(price)) return false;

  int centerIdx = findClosestTickIndex(ticks, price);
  int newMinIdx = centerIdx - tickSpan_ / 2;
  int newMaxIdx = newMinIdx + tickSpan_;
  if (newMinIdx < 0 || newMaxIdx > static_cast<int>(ticks.size()) - 1) return false;

  double newMin = ticks[static_cast<std::size_t>(newMinIdx)].price0;
  double newMax = ticks[static_cast<std::size_t>(newMaxIdx)].price0;
  if (!(newMax > newMin)) return false;

  outMin = newMin;
  outMax = newMax;
  return true;
}

void CenterDrag::onDrag(double, double y) {
  if (!active_) return;
  double newMin = 0, newMax = 0;
  if (computeRange(y, newMin, newMax)) {
    actions_.setRange(newMin, newMax);
  }
  actions_.drawAll();
}

void CenterDrag::onEnd(double, double y) {
  if (!active_) return;
  active_ = false;

  double newMin = 0, newMax = 0;
  if (computeRange(y, newMin, newMax)) {
    actions_.setRange(newMin, newMax);
  }
  actions_.setIsDragging(false);
  actions_.drawAll();

  const auto& st = reader_.state();
  if (st.hasRange()) actions_.commitRange(st.minPrice, st.maxPrice);
}

} // namespace lrc
