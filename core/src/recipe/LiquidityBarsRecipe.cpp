#include "lrc/recipe/LiquidityBarsRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/model/LiquidityDepth.hpp"
#include "lrc/recipe/GeometryBuilder.hpp"

namespace lrc {

LiquidityBarsRecipe::LiquidityBarsRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("inactive", "instancedRect@1", VertexFormat::Rect4);
  addSlot("active", "instancedRect@1", VertexFormat::Rect4);
  addSlot("hover", "instancedRect@1", VertexFormat::Rect4);
}

void LiquidityBarsRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  const auto& c = reader_.config().colors;
  out.push_back(styleCommand(drawItemId(kInactive), c.barInactive));
  out.push_back(styleCommand(drawItemId(kActive), c.barActive));
  out.push_back(styleCommand(drawItemId(kHover), c.barHover));
}

LayerFrame LiquidityBarsRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& st = reader_.state();
  const auto& ticks = reader_.ticks();
  const auto& scale = reader_.tickScale();
  ChartLayout layout = computeChartLayout(st.dimensions, reader_.config().dims);

  // bands partially outside the plot are cut at its edges
  ScissorRect clip{true, 0.0f, 0.0f,
                   static_cast<float>(layout.totalWidth),
                   static_cast<float>(layout.plotHeight)};
  for (std::size_t k = 0; k < slotCount(); k++)
    frame.commands.push_back(scissorCommand(drawItemId(k), clip));

  if (ticks.empty() || scale.size() != ticks.size()) return frame;

  const double maxLiq = maxLiquidity(ticks);
  const double bw = scale.bandwidth();
  const bool inRangeAll = st.isFullRange;

  std::vector<float> inactive, active, hover;
  for (std::size_t i = 0; i < ticks.size(); i++) {
    double y0 = scale.bandY(i);
    double y1 = y0 + bw;
    if (y1 < 0.0 || y0 > layout.plotHeight) continue;

    double w = ticks[i].activeLiquidity / maxLiq * layout.barAreaWidth;
    if (w <= 0.0) continue;
    double x0 = layout.sidebarX - w;

    bool inRange = inRangeAll ||
      (st.hasRange() && ticks[i].price0 >= st.minPrice && ticks[i].price0 <= st.maxPrice);
    appendRect(inRange ? active : inactive, x0, y0, layout.sidebarX, y1);

    if (static_cast<int>(i) == st.hoveredTick) {
      appendRect(hover, x0, y0, layout.sidebarX, y1);
    }
  }

  setSlotData(frame, kInactive, std::move(inactive));
  setSlotData(frame, kActive, std::move(active));
  setSlotData(frame, kHover, std::move(hover));
  return frame;
}

} // namespace lrc
