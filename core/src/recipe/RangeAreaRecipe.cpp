#include "lrc/recipe/RangeAreaRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/recipe/GeometryBuilder.hpp"

#include <cmath>

namespace lrc {

RangeAreaRecipe::RangeAreaRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("fill", "instancedRect@1", VertexFormat::Rect4);
}

void RangeAreaRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  out.push_back(styleCommand(drawItemId(0), reader_.config().colors.rangeArea));
}

LayerFrame RangeAreaRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& st = reader_.state();
  if (!st.hasRange()) return frame;

  const auto& xf = reader_.transform();
  double top = xf.priceToY(st.maxPrice, TickAlignment::Top);
  double bottom = xf.priceToY(st.minPrice, TickAlignment::Bottom);
  if (!std::isfinite(top) || !std::isfinite(bottom)) return frame;

  ChartLayout layout = computeChartLayout(st.dimensions, reader_.config().dims);
  if (!clipRectY(top, bottom, 0.0, layout.plotHeight)) return frame;

  std::vector<float> rect;
  appendRect(rect, 0.0, top, layout.sidebarX, bottom);
  setSlotData(frame, 0, std::move(rect));

  if (!st.isFullRange) {
    HitTarget t;
    t.kind = HitKind::CenterHandle;
    t.x0 = 0.0;
    t.y0 = top;
    t.x1 = layout.plotWidth;
    t.y1 = bottom;
    t.cursor = CursorShape::Move;
    frame.hitTargets.push_back(t);
  }
  return frame;
}

} // namespace lrc
