#include "lrc/recipe/GuideLinesRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/recipe/GeometryBuilder.hpp"

#include <cmath>

namespace lrc {

GuideLinesRecipe::GuideLinesRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("lines", "lineAA@1", VertexFormat::Rect4);
}

void GuideLinesRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  const auto& cfg = reader_.config();
  out.push_back(styleCommand(drawItemId(0), cfg.colors.guideLine,
                             static_cast<float>(cfg.dims.solidLineHeight)));
}

LayerFrame GuideLinesRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& st = reader_.state();
  if (!st.hasRange() || st.isFullRange) return frame;

  const auto& xf = reader_.transform();
  const auto& dims = reader_.config().dims;
  double minY = xf.priceToY(st.minPrice, TickAlignment::Bottom);
  double maxY = xf.priceToY(st.maxPrice, TickAlignment::Top);
  if (!std::isfinite(minY) || !std::isfinite(maxY)) return frame;

  ChartLayout layout = computeChartLayout(st.dimensions, dims);
  const double lineWidth = layout.sidebarX;
  const double half = dims.solidLineHeight / 2.0;

  std::vector<float> segs;
  appendRect(segs, 0.0, minY + half, lineWidth, minY + half);
  appendRect(segs, 0.0, maxY - half, lineWidth, maxY - half);
  setSlotData(frame, 0, std::move(segs));

  const double grab = dims.transparentLineHeight / 2.0;
  frame.hitTargets.push_back(
    HitTarget{HitKind::MinHandle, 0.0, minY - grab, lineWidth, minY + grab,
              CursorShape::ResizeVertical});
  frame.hitTargets.push_back(
    HitTarget{HitKind::MaxHandle, 0.0, maxY - grab, lineWidth, maxY + grab,
              CursorShape::ResizeVertical});
  return frame;
}

} // namespace lrc
