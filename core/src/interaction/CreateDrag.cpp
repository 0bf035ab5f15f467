#include "lrc/interaction/CreateDrag.hpp"
#include <algorithm>
#include <cmath>

namespace lrc {

CreateDrag::CreateDrag(const ChartReader& reader, ChartActions& actions)
  : reader_(reader), actions_(actions) {}

void CreateDrag::hover(double y) {
  const auto& st = reader_.state();
  if (st.isDragging || st.hasDragStart) return;

  const auto& scale = reader_.tickScale();
  int idx = scale.indexAtY(y);
  if (idx >= 0) {
    double centerY = scale.bandY(static_cast<std::size_t>(idx)) + scale.bandwidth() / 2.0;
    if (idx != st.hoveredTick || centerY != st.hoveredY)
      actions_.setChartState(ChartStatePatch::hover(idx, centerY));
  } else if (st.hoveredTick >= 0) {
    actions_.setChartState(ChartStatePatch::clearHover());
  }
}

void CreateDrag::leave() {
  if (reader_.state().hoveredTick >= 0)
    actions_.setChartState(ChartStatePatch::clearHover());
}

bool CreateDrag::computeRange(double startY, double endY, double& outMin, double& outMax) const {
  const auto& xf = reader_.transform();
  double startPrice = xf.yToPrice(startY);
  double endPrice = xf.yToPrice(endY);
  if (!std::isfinite(startPrice) || !std::isfinite(endPrice)) return false;
  if (startPrice <= 0.0 || endPrice <= 0.0) return false;

  PriceBounds data = xf.dataBounds();
  double lo = std::max(std::min(startPrice, endPrice), data.min);
  double hi = std::min(std::max(startPrice, endPrice), data.max);
  if (!(hi > lo) || lo <= 0.0) return false;

  outMin = lo;
  outMax = hi;
  return true;
}

void CreateDrag::onStart(double, double y) {
  const auto& st = reader_.state();
  if (st.isFullRange || reader_.ticks().empty()) {
    active_ = false;
    return;
  }
  active_ = true;

  ChartStatePatch p = ChartStatePatch::clearHover();
  p.setDragStart = true;
  p.hasDragStart = true;
  p.dragStartY = y;
  p.dragStartTick = reader_.tickScale().indexAtY(y);
  p.setDragCurrent = true;
  p.dragCurrentY = y;
  p.dragCurrentTick = p.dragStartTick;
  actions_.setIsDragging(true);
  actions_.setChartState(p);
}

void CreateDrag::onDrag(double, double y) {
  if (!active_) return;
  double lo = 0, hi = 0;
  if (computeRange(reader_.state().dragStartY, y, lo, hi)) {
    actions_.setRange(lo, hi);
  }
  ChartStatePatch p;
  p.setDragCurrent = true;
  p.dragCurrentY = y;
  p.dragCurrentTick = reader_.tickScale().indexAtY(y);
  actions_.setChartState(p);
}

void CreateDrag::onEnd(double, double y) {
  if (!active_) return;
  active_ = false;

  double lo = 0, hi = 0;
  bool valid = computeRange(reader_.state().dragStartY, y, lo, hi);
  if (valid) actions_.setRange(lo, hi);

  ChartStatePatch p;
  p.setDragStart = true;
  p.hasDragStart = false;
  p.setDragCurrent = true;
  actions_.setIsDragging(false);
  actions_.setChartState(p);

  if (valid) actions_.commitRange(lo, hi);
}

} // namespace lrc
