#include "lrc/state/ChartStore.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace lrc {

ChartStore::ChartStore(const ChartConfig& cfg) : config_(cfg) {
  controller_.setConfig(cfg);
  state_.dimensions.height = cfg.dims.chartHeight;
  dynamicZoomMin_ = cfg.behavior.zoomMin;
  rebuildScale();
}

void ChartStore::setConfig(const ChartConfig& cfg) {
  config_ = cfg;
  controller_.setConfig(cfg);
  updateDynamicZoomMin();
  rebuildScale();
}

void ChartStore::setRange(double minPrice, double maxPrice) {
  if (!std::isfinite(minPrice) || !std::isfinite(maxPrice)) return;
  if (!(maxPrice > minPrice)) return;
  state_.minPrice = minPrice;
  state_.maxPrice = maxPrice;
  state_.hasMinPrice = true;
  state_.hasMaxPrice = true;
}

void ChartStore::setIsDragging(bool dragging) {
  state_.isDragging = dragging;
}

void ChartStore::setChartState(const ChartStatePatch& patch) {
  if (patch.setRange) setRange(patch.minPrice, patch.maxPrice);
  if (patch.setHover) {
    state_.hoveredTick = patch.hoveredTick;
    state_.hoveredY = patch.hoveredY;
  }
  if (patch.setDragStart) {
    state_.hasDragStart = patch.hasDragStart;
    state_.dragStartY = patch.dragStartY;
    state_.dragStartTick = patch.dragStartTick;
  }
  if (patch.setDragCurrent) {
    state_.dragCurrentY = patch.dragCurrentY;
    state_.dragCurrentTick = patch.dragCurrentTick;
  }
  drawAll();
}

void ChartStore::drawAll() {
  ++redrawCount_;
  if (onRedraw_) onRedraw_();
}

void ChartStore::commitRange(double minPrice, double maxPrice) {
  if (!std::isfinite(minPrice) || !std::isfinite(maxPrice)) return;
  if (!(maxPrice > minPrice)) return;
  if (onCommit_) onCommit_(minPrice, maxPrice);
}

void ChartStore::setTicks(std::vector<TickEntry> ticks) {
  std::stable_sort(ticks.begin(), ticks.end(),
                   [](const TickEntry& a, const TickEntry& b) { return a.price0 < b.price0; });
  ticks_ = std::move(ticks);
  if (state_.hoveredTick >= static_cast<int>(ticks_.size())) state_.hoveredTick = -1;
  updateDynamicZoomMin();
  rebuildScale();
}

void ChartStore::setPriceSeries(std::vector<PricePoint> series) {
  std::stable_sort(series.begin(), series.end(),
                   [](const PricePoint& a, const PricePoint& b) { return a.time < b.time; });
  series_ = std::move(series);
}

void ChartStore::setCurrentTick(bool hasTick, int tick) {
  state_.hasCurrentTick = hasTick;
  state_.currentTick = hasTick ? tick : 0;
}

void ChartStore::setExternalRange(bool hasMin, double minPrice, bool hasMax, double maxPrice) {
  bool okMin = hasMin && std::isfinite(minPrice);
  bool okMax = hasMax && std::isfinite(maxPrice);
  if (okMin && okMax && !(maxPrice > minPrice)) {
    std::fprintf(stderr, "ChartStore::setExternalRange: inverted range %g..%g ignored\n",
                 minPrice, maxPrice);
    okMin = okMax = false;
  }
  state_.hasMinPrice = okMin;
  state_.minPrice = okMin ? minPrice : 0.0;
  state_.hasMaxPrice = okMax;
  state_.maxPrice = okMax ? maxPrice : 0.0;
}

void ChartStore::setDimensions(const Dimensions& dims) {
  state_.dimensions = dims;
  updateDynamicZoomMin();
  rebuildScale();
}

void ChartStore::setViewport(const ViewportFrame& frame) {
  if (!std::isfinite(frame.zoomLevel) || frame.zoomLevel <= 0.0 || !std::isfinite(frame.panY))
    return;
  state_.zoomLevel = frame.zoomLevel;
  state_.panY = frame.panY;
  rebuildScale();
}

void ChartStore::rebuildScale() {
  scale_.rebuild(ticks_, controller_.pitch(), config_.dims.bandPaddingInner,
                 state_.zoomLevel, state_.panY);
  ++scaleRevision_;
}

void ChartStore::updateDynamicZoomMin() {
  dynamicZoomMin_ = controller_.calculateDynamicZoomMin(ticks_.size(),
                                                        state_.dimensions.height);
}

} // namespace lrc
