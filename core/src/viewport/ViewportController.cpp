#include "lrc/viewport/ViewportController.hpp"
#include <algorithm>
#include <cmath>

namespace lrc {

void ViewportController::setConfig(const ChartConfig& cfg) {
  dims_ = cfg.dims;
  behavior_ = cfg.behavior;
}

double ViewportController::calculateDynamicZoomMin(std::size_t tickCount,
                                                   double viewportHeight) const {
  if (tickCount == 0 || pitch() <= 0.0 || viewportHeight <= 0.0) return behavior_.zoomMin;
  double fill = viewportHeight / (static_cast<double>(tickCount) * pitch());
  return std::max(behavior_.zoomMin, fill);
}

double ViewportController::effectiveZoomMax(double dynamicZoomMin) const {
  return std::max(behavior_.zoomMax, dynamicZoomMin);
}

ViewportFrame ViewportController::calculateRangeViewport(int minTickIndex, int maxTickIndex,
                                                         std::size_t tickCount,
                                                         double viewportHeight,
                                                         double dynamicZoomMin) const {
  ViewportFrame f;
  f.zoomLevel = dynamicZoomMin;
  if (tickCount == 0 || pitch() <= 0.0 || viewportHeight <= 0.0) return f;

  const int last = static_cast<int>(tickCount) - 1;
  minTickIndex = std::clamp(minTickIndex, 0, last);
  maxTickIndex = std::clamp(maxTickIndex, 0, last);

  double center = (minTickIndex + maxTickIndex) / 2.0;
  double span = std::abs(maxTickIndex - minTickIndex);
  if (span == 0.0) span = static_cast<double>(tickCount);

  double ticksVisible = viewportHeight / pitch();
  double required = span * behavior_.rangePadding;
  double zoom = std::min(ticksVisible / required, effectiveZoomMax(dynamicZoomMin));
  zoom = std::max(zoom, dynamicZoomMin);

  double step = pitch() * zoom;
  double bandCenter = (static_cast<double>(last) - center) * step
                    + step * (1.0 - dims_.bandPaddingInner) * 0.5;
  double pan = viewportHeight / 2.0 - bandCenter;

  f.zoomLevel = zoom;
  f.panY = boundPanY(pan, viewportHeight, tickCount, zoom);
  return f;
}

double ViewportController::boundPanY(double panY, double viewportHeight,
                                     std::size_t tickCount, double zoomLevel) const {
  if (tickCount == 0) return 0.0;
  double contentHeight = static_cast<double>(tickCount) * pitch() * zoomLevel;
  double minPan = std::min(0.0, viewportHeight - contentHeight);
  return std::clamp(panY, minPan, 0.0);
}

ViewportFrame ViewportController::zoomAt(const ViewportFrame& current, double targetZoom,
                                         double anchorY, double viewportHeight,
                                         std::size_t tickCount) const {
  ViewportFrame f = current;
  if (tickCount == 0 || current.zoomLevel <= 0.0) return f;

  double ratio = targetZoom / current.zoomLevel;
  f.zoomLevel = targetZoom;
  f.panY = boundPanY(anchorY - (anchorY - current.panY) * ratio,
                     viewportHeight, tickCount, targetZoom);
  return f;
}

ViewportFrame ViewportController::zoomIn(const ViewportFrame& current, double viewportHeight,
                                         std::size_t tickCount, double dynamicZoomMin) const {
  double target = std::min(current.zoomLevel * behavior_.zoomFactor,
                           effectiveZoomMax(dynamicZoomMin));
  return zoomAt(current, target, viewportHeight / 2.0, viewportHeight, tickCount);
}

ViewportFrame ViewportController::zoomOut(const ViewportFrame& current, double viewportHeight,
                                          std::size_t tickCount, double dynamicZoomMin) const {
  double target = std::max(current.zoomLevel / behavior_.zoomFactor, dynamicZoomMin);
  return zoomAt(current, target, viewportHeight / 2.0, viewportHeight, tickCount);
}

ViewportFrame ViewportController::panBy(const ViewportFrame& current, double dy,
                                        double viewportHeight, std::size_t tickCount) const {
  ViewportFrame f = current;
  f.panY = boundPanY(current.panY + dy, viewportHeight, tickCount, current.zoomLevel);
  return f;
}

} // namespace lrc
