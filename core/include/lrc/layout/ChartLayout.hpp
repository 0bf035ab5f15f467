#pragma once
#include "lrc/config/ChartConfig.hpp"
#include "lrc/model/ChartTypes.hpp"
#include <cstdint>

namespace lrc {

// Horizontal/vertical regions of the chart, in pixels:
//
//   [0, plotWidth)            price history plot
//   [gutterX, sidebarX)       liquidity bars / hover + drag-to-create overlay
//   [sidebarX, +indicator)    range indicator with handles
//   [plotHeight, totalHeight) time axis
struct ChartLayout {
  double plotWidth{0};
  double plotHeight{0};
  double gutterX{0};
  double barAreaWidth{0};
  double sidebarX{0};
  double indicatorCenterX{0};
  double totalWidth{0};
  double totalHeight{0};
};

inline ChartLayout computeChartLayout(const Dimensions& dims, const ChartDimensionsConfig& cfg) {
  ChartLayout l;
  l.plotWidth = dims.width;
  l.plotHeight = dims.height;
  l.gutterX = dims.width;
  l.barAreaWidth = cfg.liquiditySectionWidth - cfg.liquiditySectionOffset;
  l.sidebarX = l.gutterX + l.barAreaWidth;
  l.indicatorCenterX = l.sidebarX + cfg.rangeIndicatorWidth / 2.0;
  l.totalWidth = dims.width + cfg.liquiditySectionWidth;
  l.totalHeight = dims.height + cfg.timescaleHeight;
  return l;
}

// Time -> x over [0, width]. A single-instant domain maps to the middle.
inline double timeToX(std::int64_t t, std::int64_t t0, std::int64_t t1, double width) {
  if (t1 == t0) return width * 0.5;
  return static_cast<double>(t - t0) / static_cast<double>(t1 - t0) * width;
}

} // namespace lrc
