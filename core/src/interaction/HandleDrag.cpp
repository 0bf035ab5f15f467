#include "lrc/interaction/HandleDrag.hpp"
#include <algorithm>
#include <cmath>

namespace lrc {

static constexpr double kSpanEpsilon = 1e-6;

HandleDrag::HandleDrag(HandleType type, const ChartReader& reader, ChartActions& actions)
  : type_(type), reader_(reader), actions_(actions) {}

double HandleDrag::clampY(double y) const {
  double margin = reader_.config().dims.dragBoundaryMargin;
  double h = reader_.state().dimensions.height;
  return std::clamp(y, -margin, h + margin);
}

bool HandleDrag::computeRange(double draggedY, double& outMin, double& outMax) const {
  const auto& xf = reader_.transform();
  const double minH = reader_.config().dims.rangeMinHeight;
  const bool isMin = type_ == HandleType::Min;

  const double other = isMin ? initialMax_ : initialMin_;
  const double otherY = xf.priceToY(other);
  if (!std::isfinite(otherY)) return false;

  double newMin = 0, newMax = 0;
  bool swap = isMin ? draggedY < otherY : draggedY > otherY;

  if (swap) {
    double dragged = xf.yToPrice(draggedY);
    if (!std::isfinite(dragged)) return false;
    double sMin = isMin ? other : dragged;
    double sMax = isMin ? dragged : other;
    double dist = std::abs(xf.priceToY(sMax) - xf.priceToY(sMin));
    if (dist >= minH) {
      newMin = sMin;
      newMax = sMax;
    } else {
      double cy = isMin ? otherY - minH : otherY + minH;
      double cp = xf.yToPrice(cy);
      if (!std::isfinite(cp)) return false;
      newMin = isMin ? other : cp;
      newMax = isMin ? cp : other;
    }
  } else {
    double cy = draggedY;
    if (std::abs(draggedY - otherY) < minH)
      cy = isMin ? otherY + minH : otherY - minH;
    double cp = xf.yToPrice(cy);
    if (!std::isfinite(cp)) return false;
    newMin = isMin ? cp : other;
    newMax = isMin ? other : cp;
  }

  // yToPrice clamps to the data; near the edges the span can collapse
  if (!(newMax > newMin)) return false;
  double span = std::abs(xf.priceToY(newMin) - xf.priceToY(newMax));
  if (span < minH - kSpanEpsilon) return false;

  outMin = newMin;
  outMax = newMax;
  return true;
}

void HandleDrag::onStart(double, double y) {
  const auto& st = reader_.state();
  if (st.isFullRange || !st.hasRange() || reader_.ticks().empty()) {
    active_ = false;
    return;
  }
  active_ = true;
  initialMin_ = st.minPrice;
  initialMax_ = st.maxPrice;
  // Hit areas sit off the bound's own y (line alignment, handle inset)
  double grabY = reader_.transform().priceToY(type_ == HandleType::Min ? initialMin_ : initialMax_);
  grabOffset_ = std::isfinite(grabY) ? y - grabY : 0.0;
  actions_.setIsDragging(true);
}

void HandleDrag::onDrag(double, double y) {
  if (!active_) return;
  double newMin = 0, newMax = 0;
  if (computeRange(clampY(y - grabOffset_), newMin, newMax)) {
    actions_.setRange(newMin, newMax);
  }
  actions_.drawAll();
}

void HandleDrag::onEnd(double, double y) {
  if (!active_) return;
  active_ = false;

  double newMin = 0, newMax = 0;
  if (computeRange(clampY(y - grabOffset_), newMin, newMax)) {
    actions_.setRange(newMin, newMax);
  }
  actions_.setIsDragging(false);
  actions_.drawAll();

  const auto& st = reader_.state();
  if (st.hasRange()) actions_.commitRange(st.minPrice, st.maxPrice);
}

} // namespace lrc
