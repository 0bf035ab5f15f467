#include "lrc/recipe/HoverOverlayRecipe.hpp"
#include "lrc/layout/ChartLayout.hpp"
#include "lrc/recipe/GeometryBuilder.hpp"

namespace lrc {

HoverOverlayRecipe::HoverOverlayRecipe(Id idBase, Id paneId, const ChartReader& reader)
  : Recipe(idBase, paneId, reader) {
  addSlot("dragPreview", "instancedRect@1", VertexFormat::Rect4);
}

void HoverOverlayRecipe::appendBuildStyles(std::vector<CmdString>& out) const {
  out.push_back(styleCommand(drawItemId(0), reader_.config().colors.rangeArea));
}

LayerFrame HoverOverlayRecipe::draw() const {
  LayerFrame frame = beginFrame();

  const auto& st = reader_.state();
  ChartLayout layout = computeChartLayout(st.dimensions, reader_.config().dims);

  if (st.hasDragStart && !st.isFullRange) {
    double y0 = st.dragStartY;
    double y1 = st.dragCurrentY;
    if (clipRectY(y0, y1, 0.0, layout.plotHeight)) {
      std::vector<float> preview;
      appendRect(preview, layout.gutterX, y0, layout.sidebarX, y1);
      setSlotData(frame, 0, std::move(preview));
    }
  }

  frame.hitTargets.push_back(
    HitTarget{HitKind::CreateOverlay, layout.gutterX, 0.0, layout.sidebarX, layout.plotHeight,
              st.isFullRange ? CursorShape::Default : CursorShape::Crosshair});
  return frame;
}

} // namespace lrc
