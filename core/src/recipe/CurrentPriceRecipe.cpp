#include "lrc/recipe/CurrentPriceRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/recipe/GeometryBuilder.hpp"

#include <cmath>

namespace lrc {

CurrentPriceRecipe::CurrentPriceRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("dashes", "lineAA@1", VertexFormat::Rect4);
}

void CurrentPriceRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  out.push_back(styleCommand(drawItemId(0), reader_.config().colors.currentPrice, 1.0f));
}

LayerFrame CurrentPriceRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& st = reader_.state();
  if (!std::isfinite(st.currentPrice) || st.currentPrice <= 0.0) return frame;

  double y = reader_.transform().priceToY(st.currentPrice);
  ChartLayout layout = computeChartLayout(st.dimensions, reader_.config().dims);
  if (!std::isfinite(y) || y < 0.0 || y > layout.plotHeight) return frame;

  std::vector<float> dashes;
  appendDashedLine(dashes, 0.0, layout.sidebarX, y, kDash, kGap);
  setSlotData(frame, 0, std::move(dashes));
  return frame;
}

} // namespace lrc
