#pragma once
#include "lrc/model/ChartTypes.hpp"

namespace lrc {

// Mutable view state of one mounted chart. Written only through ChartStore.
// Undefined min/max prices are tracked with the has* flags.
struct ViewState {
  Dimensions dimensions;

  double minPrice{0};
  double maxPrice{0};
  bool hasMinPrice{false};
  bool hasMaxPrice{false};

  double currentPrice{0};
  int currentTick{0};
  bool hasCurrentTick{false};

  double zoomLevel{1.0};
  double panY{0.0};

  bool isDragging{false};
  bool isFullRange{false};

  // Hover over the liquidity gutter: sorted tick index, -1 when none.
  int hoveredTick{-1};
  double hoveredY{0};

  // Drag-to-create gesture on the gutter.
  bool hasDragStart{false};
  double dragStartY{0};
  int dragStartTick{-1};
  double dragCurrentY{0};
  int dragCurrentTick{-1};

  bool hasRange() const { return hasMinPrice && hasMaxPrice; }
};

// Partial update for the transient interaction fields. Only groups whose
// set* flag is true are applied.
struct ChartStatePatch {
  bool setRange{false};
  double minPrice{0};
  double maxPrice{0};

  bool setHover{false};
  int hoveredTick{-1};
  double hoveredY{0};

  bool setDragStart{false};
  bool hasDragStart{false};
  double dragStartY{0};
  int dragStartTick{-1};

  bool setDragCurrent{false};
  double dragCurrentY{0};
  int dragCurrentTick{-1};

  static ChartStatePatch hover(int tickIndex, double y) {
    ChartStatePatch p;
    p.setHover = true;
    p.hoveredTick = tickIndex;
    p.hoveredY = y;
    return p;
  }

  static ChartStatePatch clearHover() { return hover(-1, 0); }
};

} // namespace lrc
