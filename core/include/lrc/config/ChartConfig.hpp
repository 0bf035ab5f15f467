#pragma once
#include <string>

namespace lrc {

// Pixel geometry of the chart and its liquidity gutter.
struct ChartDimensionsConfig {
  double chartHeight{380};
  double timescaleHeight{24};
  double liquiditySectionWidth{80};
  double liquiditySectionOffset{12};
  double barHeight{3};
  double barSpacing{1};
  double bandPaddingInner{0.05};
  double rangeMinHeight{16};
  double dragBoundaryMargin{10};
  double rangeIndicatorWidth{10};
  double handleRadius{6};
  double centerHandleWidth{10};
  double centerHandleHeight{6};
  double solidLineHeight{1};
  double transparentLineHeight{12};
  double priceDotRadius{6};
  double minPlotWidth{200};
  double fallbackWidth{400};
};

struct ChartBehaviorConfig {
  double zoomFactor{1.3};
  double zoomMin{0.1};
  double zoomMax{10.0};
  double rangePadding{1.25};    // fraction of the selected span kept visible
  double defaultRangeLow{0.2};  // reset() window, fraction of the price band
  double defaultRangeHigh{0.8};
  double wheelPanStep{40};      // pixels per wheel notch when panning
  int measureRetries{10};
  double measureBackoffMs{50};
};

struct ChartColors {
  float background[4] = {0.08f, 0.08f, 0.09f, 1.0f};

  float barActive[4] = {0.96f, 0.55f, 0.26f, 0.75f};
  float barInactive[4] = {0.55f, 0.55f, 0.60f, 0.35f};
  float barHover[4] = {1.0f, 1.0f, 1.0f, 0.55f};

  float priceLineInRange[4] = {0.96f, 0.55f, 0.26f, 1.0f};
  float priceLineOutOfRange[4] = {0.55f, 0.55f, 0.60f, 1.0f};
  float priceLineWidth{2.0f};

  float rangeArea[4] = {0.96f, 0.55f, 0.26f, 0.12f};
  float guideLine[4] = {0.96f, 0.55f, 0.26f, 0.8f};

  float indicatorTrack[4] = {0.96f, 0.55f, 0.26f, 0.15f};
  float indicatorTrackFull[4] = {0.96f, 0.55f, 0.26f, 0.5f};
  float indicatorFill[4] = {0.96f, 0.55f, 0.26f, 1.0f};
  float handleFill[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float handleStroke[4] = {0.0f, 0.0f, 0.0f, 0.25f};
  float gripLine[4] = {0.0f, 0.0f, 0.0f, 0.3f};

  float currentPrice[4] = {0.85f, 0.85f, 0.90f, 0.6f};
  float axisTick[4] = {0.45f, 0.45f, 0.50f, 1.0f};
  float axisLabel[4] = {0.6f, 0.6f, 0.65f, 1.0f};
};

struct ChartConfig {
  ChartDimensionsConfig dims;
  ChartBehaviorConfig behavior;
  ChartColors colors;
};

// Serialize to a JSON object with "dimensions", "behavior" and "colors".
std::string serializeChartConfig(const ChartConfig& cfg);

// Overlay JSON onto `out`. Missing or wrongly typed keys keep their current
// value. Returns false (out untouched) if the text is not a JSON object.
bool parseChartConfig(const std::string& json, ChartConfig& out);

} // namespace lrc
