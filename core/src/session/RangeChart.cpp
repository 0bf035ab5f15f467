#include "lrc/session/RangeChart.hpp"
#include "lrc/model/LiquidityDepth.hpp"
#include "lrc/recipe/CurrentPriceRecipe.hpp"
#include "lrc/recipe/GuideLinesRecipe.hpp"
#include "lrc/recipe/HoverOverlayRecipe.hpp"
#include "lrc/recipe/LiquidityBarsRecipe.hpp"
#include "lrc/recipe/PriceLineRecipe.hpp"
#include "lrc/recipe/RangeAreaRecipe.hpp"
#include "lrc/recipe/RangeIndicatorRecipe.hpp"
#include "lrc/recipe/TimeAxisRecipe.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace lrc {

static bool sameTicks(const std::vector<TickEntry>& a, const std::vector<TickEntry>& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); i++) {
    if (a[i].tick != b[i].tick || a[i].price0 != b[i].price0 ||
        a[i].price1 != b[i].price1 || a[i].activeLiquidity != b[i].activeLiquidity)
      return false;
  }
  return true;
}

RangeChart::RangeChart(const ChartConfig& cfg) : store_(cfg) {
  probe_.configure(cfg.behavior.measureRetries, cfg.behavior.measureBackoffMs);

  store_.setRedrawHandler([this]() { redraw(); });
  store_.setCommitHandler([this](double minPrice, double maxPrice) {
    if (onRangeChange_) onRangeChange_(minPrice, maxPrice);
  });

  buildScene();
}

RangeChart::~RangeChart() {
  store_.setRedrawHandler(nullptr);
  store_.setCommitHandler(nullptr);
}

void RangeChart::buildScene() {
  apply(R"({"cmd":"createPane","id":)" + std::to_string(kPaneId) + R"(,"name":"rangeChart"})");

  // Back-to-front.
  Id base = kRecipeIdStride;
  recipes_.push_back(std::make_unique<LiquidityBarsRecipe>(base * 1, kPaneId, store_));
  recipes_.push_back(std::make_unique<PriceLineRecipe>(base * 2, kPaneId, store_));
  recipes_.push_back(std::make_unique<RangeAreaRecipe>(base * 3, kPaneId, store_));
  recipes_.push_back(std::make_unique<GuideLinesRecipe>(base * 4, kPaneId, store_));
  recipes_.push_back(std::make_unique<RangeIndicatorRecipe>(base * 5, kPaneId, store_));
  recipes_.push_back(std::make_unique<CurrentPriceRecipe>(base * 6, kPaneId, store_));
  recipes_.push_back(std::make_unique<HoverOverlayRecipe>(base * 7, kPaneId, store_));
  recipes_.push_back(std::make_unique<TimeAxisRecipe>(base * 8, kPaneId, store_));

  for (const auto& r : recipes_) {
    RecipeBuildResult built = r->build();
    for (const auto& cmd : built.createCommands) apply(cmd);
  }
  for (Id id : scene_.bufferIds()) buffers_.ensureBuffer(id);
}

void RangeChart::unmount() {
  if (activeDrag_) {
    store_.setIsDragging(false);
    activeDrag_ = nullptr;
  }
  for (auto it = recipes_.rbegin(); it != recipes_.rend(); ++it) {
    RecipeBuildResult built = (*it)->build();
    for (const auto& cmd : built.disposeCommands) apply(cmd);
  }
  if (scene_.hasPane(kPaneId))
    apply(R"({"cmd":"delete","id":)" + std::to_string(kPaneId) + "}");
  for (Id id : buffers_.bufferIds()) buffers_.removeBuffer(id);

  recipes_.clear();
  hitTargets_.clear();
  labels_.clear();
  mounted_ = false;
  initialized_ = false;
}

bool RangeChart::apply(const std::string& json) {
  CmdResult r = cp_.applyJsonText(json);
  if (!r.ok) {
    failedCommands_++;
    std::fprintf(stderr, "RangeChart: command failed [%s] %s %s\n",
                 r.err.code.c_str(), r.err.message.c_str(), r.err.details.c_str());
    return false;
  }
  return true;
}

// ---- props & lifecycle ----

void RangeChart::setProps(const ChartProps& props) {
  bool ticksChanged = !sameTicks(props.ticks, props_.ticks);
  bool rangeChanged = props.hasMinPrice != props_.hasMinPrice ||
                      props.hasMaxPrice != props_.hasMaxPrice ||
                      props.minPrice != props_.minPrice ||
                      props.maxPrice != props_.maxPrice ||
                      props.currentPrice != props_.currentPrice;
  props_ = props;

  if (ticksChanged) store_.setTicks(props.ticks);
  store_.setPriceSeries(props.priceSeries);
  store_.setCurrentPrice(props.currentPrice);
  store_.setCurrentTick(props.hasCurrentTick, props.currentTick);
  store_.setFullRange(props.isFullRange);
  store_.setDuration(props.duration);
  // Only a changed prop overrides the range the user dragged to.
  if (rangeChanged || !propsSeen_)
    store_.setExternalRange(props.hasMinPrice, props.minPrice, props.hasMaxPrice, props.maxPrice);

  if (ticksChanged || rangeChanged) viewportStale_ = true;
  propsSeen_ = true;
  if (!initialized_) return;

  if (viewportStale_) frameInitialViewport();
  store_.drawAll();
}

void RangeChart::mount(double nowMs) {
  mounted_ = true;
  probe_.start(nowMs);
}

void RangeChart::tick(double nowMs) {
  if (!mounted_) return;

  if (!initialized_) {
    double w = 0, h = 0;
    ProbeStatus st = probe_.poll(nowMs, measure_, w, h);
    if (st == ProbeStatus::Pending) return;

    const auto& dims = store_.config().dims;
    if (st == ProbeStatus::Measured) {
      applyDimensions(w, h);
    } else {
      store_.setDimensions(Dimensions{dims.fallbackWidth, dims.chartHeight});
    }
    initialized_ = true;
    resizePending_ = false;
    frameInitialViewport();
    store_.drawAll();
    return;
  }

  if (resizePending_) {
    resizePending_ = false;
    double w = 0, h = 0;
    if (measure_ && measure_(w, h) && w > 0.0) {
      applyDimensions(w, h);
      frameInitialViewport();
      store_.drawAll();
    }
  }
}

void RangeChart::setContainerSize(double width, double height) {
  mounted_ = true;
  resizePending_ = false;
  applyDimensions(width, height);
  initialized_ = true;
  frameInitialViewport();
  store_.drawAll();
}

void RangeChart::applyDimensions(double containerWidth, double containerHeight) {
  const auto& dims = store_.config().dims;
  Dimensions d;
  d.width = std::max(dims.minPlotWidth, containerWidth - dims.liquiditySectionWidth);
  d.height = containerHeight > dims.timescaleHeight
           ? containerHeight - dims.timescaleHeight
           : dims.chartHeight;
  store_.setDimensions(d);
}

// Frame [min, max] when a range is selected, else +-20% around the current price.
void RangeChart::frameInitialViewport() {
  viewportStale_ = false;
  const auto& ticks = store_.ticks();
  if (ticks.empty()) return;

  const auto& st = store_.state();
  double lo = st.hasMinPrice ? st.minPrice : st.currentPrice * 0.8;
  double hi = st.hasMaxPrice ? st.maxPrice : st.currentPrice * 1.2;

  int minIdx = findClosestTickIndex(ticks, lo);
  int maxIdx = findClosestTickIndex(ticks, hi);
  updateViewport(store_.viewportController().calculateRangeViewport(
      minIdx, maxIdx, ticks.size(), st.dimensions.height, store_.dynamicZoomMin()));
}

void RangeChart::updateViewport(const ViewportFrame& frame) {
  store_.setViewport(frame);
}

ChartLayout RangeChart::layout() const {
  return computeChartLayout(store_.state().dimensions, store_.config().dims);
}

// ---- drawing ----

void RangeChart::redraw() {
  if (!initialized_ || recipes_.empty()) return;

  apply(R"({"cmd":"beginFrame"})");
  hitTargets_.clear();
  labels_.clear();
  for (const auto& r : recipes_) {
    LayerFrame frame = r->draw();
    applyFrame(frame);
    hitTargets_.insert(hitTargets_.end(), frame.hitTargets.begin(), frame.hitTargets.end());
    for (auto& l : frame.labels) labels_.push_back(std::move(l));
  }
  buffers_.syncBufferLengths(scene_);
  apply(R"({"cmd":"commitFrame"})");
  frames_++;
}

void RangeChart::applyFrame(const LayerFrame& frame) {
  for (const auto& w : frame.writes) {
    buffers_.setBufferData(w.bufferId, w.data.data(),
                           static_cast<std::uint32_t>(w.data.size() * sizeof(float)));
    apply(R"({"cmd":"setGeometryVertexCount","geometryId":)" + std::to_string(w.geometryId) +
          R"(,"vertexCount":)" + std::to_string(w.vertexCount) + "}");
  }
  for (const auto& cmd : frame.commands) apply(cmd);
}

const HitTarget* RangeChart::hitTest(double x, double y) const {
  return findTopmost(hitTargets_, x, y);
}

// ---- input ----

DragBehavior* RangeChart::behaviorFor(HitKind kind) {
  switch (kind) {
    case HitKind::MinHandle:     return &minDrag_;
    case HitKind::MaxHandle:     return &maxDrag_;
    case HitKind::CenterHandle:  return &centerDrag_;
    case HitKind::CreateOverlay: return &createDrag_;
    default:                     return nullptr;
  }
}

bool RangeChart::inGutter(double x) const {
  ChartLayout l = layout();
  return x >= l.gutterX && x <= l.sidebarX;
}

CursorShape RangeChart::handlePointer(const PointerEvent& ev) {
  if (!initialized_) return CursorShape::Default;

  const auto& st = store_.state();
  const std::size_t n = store_.ticks().size();
  const double h = st.dimensions.height;

  switch (ev.action) {
    case PointerAction::Down:
      if (ev.button == PointerButton::Left && !activeDrag_) {
        const HitTarget* t = hitTest(ev.x, ev.y);
        DragBehavior* b = t ? behaviorFor(t->kind) : nullptr;
        if (b) {
          b->onStart(ev.x, ev.y);
          if (b->active()) activeDrag_ = b;
        }
      } else if (ev.button == PointerButton::Middle) {
        panning_ = true;
        lastPanY_ = ev.y;
      }
      break;

    case PointerAction::Move:
      if (activeDrag_) {
        activeDrag_->onDrag(ev.x, ev.y);
      } else if (panning_) {
        double dy = ev.y - lastPanY_;
        lastPanY_ = ev.y;
        if (n > 0 && dy != 0.0) {
          updateViewport(store_.viewportController().panBy(store_.viewport(), dy, h, n));
          store_.drawAll();
        }
      } else if (inGutter(ev.x)) {
        createDrag_.hover(ev.y);
      } else {
        createDrag_.leave();
      }
      break;

    case PointerAction::Up:
      if (ev.button == PointerButton::Left && activeDrag_) {
        DragBehavior* b = activeDrag_;
        activeDrag_ = nullptr;
        b->onEnd(ev.x, ev.y);
      } else if (ev.button == PointerButton::Middle) {
        panning_ = false;
      }
      break;

    case PointerAction::Wheel: {
      if (n == 0 || ev.wheelDelta == 0.0) break;
      const auto& ctl = store_.viewportController();
      if (ev.shift || ev.ctrl) {
        double dy = ev.wheelDelta * store_.config().behavior.wheelPanStep;
        updateViewport(ctl.panBy(store_.viewport(), dy, h, n));
      } else {
        double dynMin = store_.dynamicZoomMin();
        double target = st.zoomLevel * std::pow(store_.config().behavior.zoomFactor, ev.wheelDelta);
        target = std::clamp(target, dynMin, ctl.effectiveZoomMax(dynMin));
        updateViewport(ctl.zoomAt(store_.viewport(), target, ev.y, h, n));
      }
      store_.drawAll();
      break;
    }

    case PointerAction::Leave:
      panning_ = false;
      if (!activeDrag_) createDrag_.leave();
      break;
  }

  if (activeDrag_) {
    if (activeDrag_ == &createDrag_) return CursorShape::Crosshair;
    if (activeDrag_ == &centerDrag_) return CursorShape::Move;
    return CursorShape::ResizeVertical;
  }
  const HitTarget* t = hitTest(ev.x, ev.y);
  return t ? t->cursor : CursorShape::Default;
}

// ---- imperative surface ----

void RangeChart::zoomIn() {
  const std::size_t n = store_.ticks().size();
  if (n == 0) return;
  updateViewport(store_.viewportController().zoomIn(
      store_.viewport(), store_.state().dimensions.height, n, store_.dynamicZoomMin()));
  store_.drawAll();
}

void RangeChart::zoomOut() {
  const std::size_t n = store_.ticks().size();
  if (n == 0) return;
  updateViewport(store_.viewportController().zoomOut(
      store_.viewport(), store_.state().dimensions.height, n, store_.dynamicZoomMin()));
  store_.drawAll();
}

void RangeChart::centerRange() {
  const auto& ticks = store_.ticks();
  const auto& st = store_.state();
  if (!st.hasRange() || ticks.empty()) return;

  int minIdx = findClosestTickIndex(ticks, st.minPrice);
  int maxIdx = findClosestTickIndex(ticks, st.maxPrice);
  updateViewport(store_.viewportController().calculateRangeViewport(
      minIdx, maxIdx, ticks.size(), st.dimensions.height, store_.dynamicZoomMin()));
  store_.drawAll();
  store_.commitRange(st.minPrice, st.maxPrice);
}

void RangeChart::reset() {
  const auto& ticks = store_.ticks();
  if (ticks.empty()) return;

  const auto& st = store_.state();
  const auto& behavior = store_.config().behavior;
  const int n = static_cast<int>(ticks.size());
  if (n < 2) {
    std::fprintf(stderr, "RangeChart::reset: need two ticks for a range, have %d\n", n);
    return;
  }

  int minIdx = 0;
  int maxIdx = n - 1;
  double lo = ticks.front().price0;
  double hi = ticks.back().price0;

  if (!st.isFullRange) {
    const auto& series = store_.priceSeries();
    PriceBounds bounds = priceSeriesBounds(series);
    double last = series.empty() ? st.currentPrice : series.back().value;

    // Window centered on the latest price, wide enough for the whole history.
    double spread = std::max(last - bounds.min, bounds.max - last);
    double windowMin = last - spread;
    double windowSpan = 2.0 * spread;

    minIdx = findClosestTickIndex(ticks, windowMin + windowSpan * behavior.defaultRangeLow);
    maxIdx = findClosestTickIndex(ticks, windowMin + windowSpan * behavior.defaultRangeHigh);
    // A flat history snaps both ends to one tick; keep at least one band.
    if (maxIdx <= minIdx) {
      if (minIdx < n - 1) maxIdx = minIdx + 1;
      else minIdx = maxIdx - 1;
    }
    lo = ticks[static_cast<std::size_t>(minIdx)].price0;
    hi = ticks[static_cast<std::size_t>(maxIdx)].price0;
  }

  updateViewport(store_.viewportController().calculateRangeViewport(
      minIdx, maxIdx, ticks.size(), st.dimensions.height, store_.dynamicZoomMin()));
  store_.setRange(lo, hi);
  store_.drawAll();
  store_.commitRange(lo, hi);
}

} // namespace lrc
