#include "lrc/recipe/RangeIndicatorRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/recipe/GeometryBuilder.hpp"

#include <algorithm>
#include <cmath>

namespace lrc {

RangeIndicatorRecipe::RangeIndicatorRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("track", "instancedRect@1", VertexFormat::Rect4);
  addSlot("bar", "instancedRect@1", VertexFormat::Rect4);
  addSlot("handleStroke", "triSolid@1", VertexFormat::Pos2);
  addSlot("handleFill", "triSolid@1", VertexFormat::Pos2);
  addSlot("gripStroke", "instancedRect@1", VertexFormat::Rect4);
  addSlot("gripFill", "instancedRect@1", VertexFormat::Rect4);
  addSlot("gripLines", "instancedRect@1", VertexFormat::Rect4);
}

void RangeIndicatorRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  const auto& c = reader_.config().colors;
  out.push_back(styleCommand(drawItemId(kTrack), c.indicatorTrack));
  out.push_back(styleCommand(drawItemId(kBar), c.indicatorFill));
  out.push_back(styleCommand(drawItemId(kHandleStroke), c.handleStroke));
  out.push_back(styleCommand(drawItemId(kHandleFill), c.handleFill));
  out.push_back(styleCommand(drawItemId(kGripStroke), c.handleStroke));
  out.push_back(styleCommand(drawItemId(kGripFill), c.handleFill));
  out.push_back(styleCommand(drawItemId(kGripLines), c.gripLine));
}

LayerFrame RangeIndicatorRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& st = reader_.state();
  const auto& cfg = reader_.config();
  const auto& dims = cfg.dims;
  ChartLayout layout = computeChartLayout(st.dimensions, dims);

  const double x0 = layout.sidebarX;
  const double x1 = layout.sidebarX + dims.rangeIndicatorWidth;

  std::vector<float> track;
  appendRect(track, x0, 0.0, x1, layout.plotHeight);
  setSlotData(frame, kTrack, std::move(track));

  bool full = st.hasRange() && st.isFullRange;
  frame.commands.push_back(styleCommand(drawItemId(kTrack),
      full ? cfg.colors.indicatorTrackFull : cfg.colors.indicatorTrack));

  if (!st.hasRange() || st.isFullRange) return frame;

  const auto& xf = reader_.transform();
  double minY = xf.priceToY(st.minPrice, TickAlignment::Bottom);
  double maxY = xf.priceToY(st.maxPrice, TickAlignment::Top);
  if (!std::isfinite(minY) || !std::isfinite(maxY)) return frame;

  double height = minY - maxY;
  double constrained = std::max(height, dims.rangeMinHeight);
  double diff = constrained - height;
  double top = maxY - diff / 2.0;
  double bottom = minY + diff / 2.0;

  std::vector<float> bar;
  appendRect(bar, x0, top, x1, bottom);
  setSlotData(frame, kBar, std::move(bar));

  const double cx = layout.indicatorCenterX;
  const double r = dims.handleRadius;
  const double maxHandleY = top + kHandleInset;
  const double minHandleY = bottom - kHandleInset;

  std::vector<float> stroke, fill;
  appendCircle(stroke, cx, maxHandleY, r + 1.0);
  appendCircle(stroke, cx, minHandleY, r + 1.0);
  appendCircle(fill, cx, maxHandleY, r);
  appendCircle(fill, cx, minHandleY, r);
  setSlotData(frame, kHandleStroke, std::move(stroke));
  setSlotData(frame, kHandleFill, std::move(fill));

  const double centerY = (top + bottom) / 2.0;
  const double gw = dims.centerHandleWidth / 2.0;
  const double gh = dims.centerHandleHeight / 2.0;

  std::vector<float> gripStroke, gripFill, gripLines;
  appendRect(gripStroke, cx - gw - 1.0, centerY - gh - 1.0, cx + gw + 1.0, centerY + gh + 1.0);
  appendRect(gripFill, cx - gw, centerY - gh, cx + gw, centerY + gh);
  for (int i = 0; i < 3; i++) {
    double lx = cx - 1.75 + i * 1.5;
    appendRect(gripLines, lx, centerY - 1.5, lx + 0.5, centerY + 1.5);
  }
  setSlotData(frame, kGripStroke, std::move(gripStroke));
  setSlotData(frame, kGripFill, std::move(gripFill));
  setSlotData(frame, kGripLines, std::move(gripLines));

  // bar first so the handles win where they overlap it
  frame.hitTargets.push_back(
    HitTarget{HitKind::CenterHandle, x0, top, x1, bottom, CursorShape::Move});
  frame.hitTargets.push_back(
    HitTarget{HitKind::CenterHandle, cx - gw, centerY - gh, cx + gw, centerY + gh,
              CursorShape::Move});
  frame.hitTargets.push_back(
    HitTarget{HitKind::MaxHandle, cx - r, maxHandleY - r, cx + r, maxHandleY + r,
              CursorShape::ResizeVertical});
  frame.hitTargets.push_back(
    HitTarget{HitKind::MinHandle, cx - r, minHandleY - r, cx + r, minHandleY + r,
              CursorShape::ResizeVertical});
  return frame;
}

} // namespace lrc
