#pragma once
#include "lrc/config/ChartConfig.hpp"
#include "lrc/model/ChartTypes.hpp"
#include "lrc/scale/CoordinateTransform.hpp"
#include "lrc/scale/TickScale.hpp"
#include "lrc/state/ViewState.hpp"
#include <vector>

namespace lrc {

// Read side of the chart store. Renderers and drag behaviors get this plus,
// when they need to write, a ChartActions.
class ChartReader {
public:
  virtual ~ChartReader() = default;

  virtual const ViewState& state() const = 0;
  virtual const std::vector<TickEntry>& ticks() const = 0;
  virtual const std::vector<PricePoint>& priceSeries() const = 0;
  virtual const TickScale& tickScale() const = 0;
  virtual const CoordinateTransform& transform() const = 0;
  virtual const ChartConfig& config() const = 0;
  virtual HistoryDuration duration() const = 0;
};

// Write side available to interaction code. Everything else about the
// state belongs to the host.
class ChartActions {
public:
  virtual ~ChartActions() = default;

  // Update the selected range without redrawing or notifying.
  virtual void setRange(double minPrice, double maxPrice) = 0;

  virtual void setIsDragging(bool dragging) = 0;

  // Merge transient fields, then redraw every layer.
  virtual void setChartState(const ChartStatePatch& patch) = 0;

  virtual void drawAll() = 0;

  // Report a completed range to the host. Ignored unless min < max.
  virtual void commitRange(double minPrice, double maxPrice) = 0;
};

} // namespace lrc
