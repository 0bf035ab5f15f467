#pragma once
#include "lrc/config/ChartConfig.hpp"
#include <cstddef>

namespace lrc {

struct ViewportFrame {
  double zoomLevel{1.0};
  double panY{0.0};
};

// Zoom/pan arithmetic for the vertical tick axis. Stateless apart from config:
// the chart store owns the current frame and this class computes the next one.
class ViewportController {
public:
  void setConfig(const ChartConfig& cfg);

  // Unzoomed distance between consecutive band tops.
  double pitch() const { return dims_.barHeight + dims_.barSpacing; }

  // Smallest zoom that still fills the viewport with every tick, but never
  // below the configured floor.
  double calculateDynamicZoomMin(std::size_t tickCount, double viewportHeight) const;

  // Zoom ceiling; raised to the dynamic floor for tiny data sets.
  double effectiveZoomMax(double dynamicZoomMin) const;

  // Zoom/pan that fits the index span [minTickIndex, maxTickIndex] with
  // rangePadding headroom and centers its midpoint band vertically.
  // A zero span fits tickCount bands instead.
  ViewportFrame calculateRangeViewport(int minTickIndex, int maxTickIndex,
                                       std::size_t tickCount, double viewportHeight,
                                       double dynamicZoomMin) const;

  // Clamp pan so the content never leaves a gap at the top and never
  // scrolls past its own bottom: [min(0, h - contentHeight), 0].
  double boundPanY(double panY, double viewportHeight, std::size_t tickCount,
                   double zoomLevel) const;

  // Scale around anchorY (the content point under the anchor stays put),
  // then bound the pan.
  ViewportFrame zoomAt(const ViewportFrame& current, double targetZoom, double anchorY,
                       double viewportHeight, std::size_t tickCount) const;

  // One zoomFactor step around the viewport center.
  ViewportFrame zoomIn(const ViewportFrame& current, double viewportHeight,
                       std::size_t tickCount, double dynamicZoomMin) const;
  ViewportFrame zoomOut(const ViewportFrame& current, double viewportHeight,
                        std::size_t tickCount, double dynamicZoomMin) const;

  ViewportFrame panBy(const ViewportFrame& current, double dy, double viewportHeight,
                      std::size_t tickCount) const;

private:
  ChartDimensionsConfig dims_;
  ChartBehaviorConfig behavior_;
};

} // namespace lrc
