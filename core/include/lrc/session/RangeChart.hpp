#pragma once
#include "lrc/commands/CommandProcessor.hpp"
#include "lrc/interaction/CenterDrag.hpp"
#include "lrc/interaction/CreateDrag.hpp"
#include "lrc/interaction/HandleDrag.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/recipe/Recipe.hpp"
#include "lrc/scene/BufferStore.hpp"
#include "lrc/session/MeasureProbe.hpp"
#include "lrc/state/ChartStore.hpp"
#include "lrc/viewport/InputState.hpp"

#include <functional>
#include <memory>
#include <vector>

namespace lrc {

// Inputs supplied by the embedding page, refreshed whenever they change.
struct ChartProps {
  std::vector<TickEntry> ticks;
  std::vector<PricePoint> priceSeries;
  double currentPrice{0};
  bool hasCurrentTick{false};
  int currentTick{0};
  bool hasMinPrice{false};
  double minPrice{0};
  bool hasMaxPrice{false};
  double maxPrice{0};
  bool isFullRange{false};
  HistoryDuration duration{HistoryDuration::Month};
};

using RangeChangeFn = std::function<void(double minPrice, double maxPrice)>;

// The embeddable chart: owns the store, the retained scene and the layer
// recipes, routes pointer input to the drag behaviors and exposes the
// imperative zoom / center / reset surface.
//
// Nothing is drawn until the container has been measured (or the probe has
// fallen back to the default size). Call tick() once per animation frame.
class RangeChart {
public:
  explicit RangeChart(const ChartConfig& cfg = ChartConfig{});
  ~RangeChart();

  RangeChart(const RangeChart&) = delete;
  RangeChart& operator=(const RangeChart&) = delete;

  // Called once per committed gesture, reset() and centerRange().
  void setRangeChangeHandler(RangeChangeFn fn) { onRangeChange_ = std::move(fn); }
  void setMeasureFunction(MeasureProbe::MeasureFn fn) { measure_ = std::move(fn); }

  void setProps(const ChartProps& props);

  // Start measuring the container; the first attempt runs at the next tick().
  void mount(double nowMs);
  void tick(double nowMs);

  // Container size changed; re-measured at the next tick().
  void onContainerResize() { resizePending_ = true; }

  // Container size known directly (skips the probe).
  void setContainerSize(double width, double height);

  bool initialized() const { return initialized_; }

  // Returns the cursor shape for the pointer position after the event.
  CursorShape handlePointer(const PointerEvent& ev);

  void zoomIn();
  void zoomOut();
  void centerRange();
  void reset();

  // Apply every recipe's dispose commands and drop the pane.
  void unmount();

  const ChartStore& store() const { return store_; }
  const Scene& scene() const { return scene_; }
  const BufferStore& buffers() const { return buffers_; }
  const CommandProcessor& commands() const { return cp_; }
  ChartLayout layout() const;

  const std::vector<TextLabel>& labels() const { return labels_; }
  const std::vector<HitTarget>& hitTargets() const { return hitTargets_; }
  const HitTarget* hitTest(double x, double y) const;

  const std::vector<std::unique_ptr<Recipe>>& recipes() const { return recipes_; }

  bool isDragging() const { return activeDrag_ != nullptr; }
  bool isPanning() const { return panning_; }
  std::uint64_t frameCount() const { return frames_; }
  std::uint32_t failedCommands() const { return failedCommands_; }

  static constexpr Id kPaneId = 1;
  static constexpr Id kRecipeIdStride = 100;

private:
  void buildScene();
  void redraw();
  void applyFrame(const LayerFrame& frame);
  bool apply(const std::string& json);

  void applyDimensions(double containerWidth, double containerHeight);
  void frameInitialViewport();
  void updateViewport(const ViewportFrame& frame);

  DragBehavior* behaviorFor(HitKind kind);
  bool inGutter(double x) const;

  ChartStore store_;
  Scene scene_;
  ResourceRegistry registry_;
  CommandProcessor cp_{scene_, registry_};
  BufferStore buffers_;

  std::vector<std::unique_ptr<Recipe>> recipes_;
  std::vector<HitTarget> hitTargets_;
  std::vector<TextLabel> labels_;

  HandleDrag minDrag_{HandleType::Min, store_, store_};
  HandleDrag maxDrag_{HandleType::Max, store_, store_};
  CenterDrag centerDrag_{store_, store_};
  CreateDrag createDrag_{store_, store_};
  DragBehavior* activeDrag_{nullptr};

  bool panning_{false};
  double lastPanY_{0};

  MeasureProbe probe_;
  MeasureProbe::MeasureFn measure_;
  bool mounted_{false};
  bool initialized_{false};
  bool resizePending_{false};
  bool viewportStale_{true};

  ChartProps props_;
  bool propsSeen_{false};
  RangeChangeFn onRangeChange_;

  std::uint64_t frames_{0};
  std::uint32_t failedCommands_{0};
};

} // namespace lrc
