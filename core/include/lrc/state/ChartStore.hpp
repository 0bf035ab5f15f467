#pragma once
#include "lrc/state/ChartAccess.hpp"
#include "lrc/viewport/ViewportController.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace lrc {

// Single owner of the chart's view state, input series and derived scales.
// Interaction code writes through the ChartActions subset; the host uses the
// remaining setters. The tick scale is rebuilt only when ticks, dimensions,
// zoom or pan change.
class ChartStore : public ChartReader, public ChartActions {
public:
  using RedrawFn = std::function<void()>;
  using CommitFn = std::function<void(double minPrice, double maxPrice)>;

  explicit ChartStore(const ChartConfig& cfg = ChartConfig{});
  ChartStore(const ChartStore&) = delete;
  ChartStore& operator=(const ChartStore&) = delete;

  // ChartReader
  const ViewState& state() const override { return state_; }
  const std::vector<TickEntry>& ticks() const override { return ticks_; }
  const std::vector<PricePoint>& priceSeries() const override { return series_; }
  const TickScale& tickScale() const override { return scale_; }
  const CoordinateTransform& transform() const override { return transform_; }
  const ChartConfig& config() const override { return config_; }
  HistoryDuration duration() const override { return duration_; }

  // ChartActions
  void setRange(double minPrice, double maxPrice) override;
  void setIsDragging(bool dragging) override;
  void setChartState(const ChartStatePatch& patch) override;
  void drawAll() override;
  void commitRange(double minPrice, double maxPrice) override;

  void setRedrawHandler(RedrawFn fn) { onRedraw_ = std::move(fn); }
  void setCommitHandler(CommitFn fn) { onCommit_ = std::move(fn); }

  void setConfig(const ChartConfig& cfg);

  // Sorted by ascending price0 (stable) before storing.
  void setTicks(std::vector<TickEntry> ticks);
  // Sorted by time before storing.
  void setPriceSeries(std::vector<PricePoint> series);

  void setCurrentPrice(double price) { state_.currentPrice = price; }
  void setCurrentTick(bool hasTick, int tick);
  void setFullRange(bool fullRange) { state_.isFullRange = fullRange; }
  void setDuration(HistoryDuration d) { duration_ = d; }

  // Externally controlled bounds; either side may be undefined.
  void setExternalRange(bool hasMin, double minPrice, bool hasMax, double maxPrice);

  void setDimensions(const Dimensions& dims);
  void setViewport(const ViewportFrame& frame);
  ViewportFrame viewport() const { return {state_.zoomLevel, state_.panY}; }

  double dynamicZoomMin() const { return dynamicZoomMin_; }
  const ViewportController& viewportController() const { return controller_; }

  std::uint64_t scaleRevision() const { return scaleRevision_; }
  std::uint64_t redrawCount() const { return redrawCount_; }

private:
  void rebuildScale();
  void updateDynamicZoomMin();

  ChartConfig config_;
  ViewportController controller_;
  ViewState state_;
  HistoryDuration duration_{HistoryDuration::Month};

  std::vector<TickEntry> ticks_;
  std::vector<PricePoint> series_;
  TickScale scale_;
  CoordinateTransform transform_{ticks_, scale_};
  double dynamicZoomMin_{0.1};

  RedrawFn onRedraw_;
  CommitFn onCommit_;
  std::uint64_t scaleRevision_{0};
  std::uint64_t redrawCount_{0};
};

} // namespace lrc
