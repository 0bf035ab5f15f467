#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Topmost interactive layer over the liquidity gutter. Always emits a
// CreateOverlay hit target (hover tracking works in full-range mode too) and
// shades the span of an in-progress drag-to-create gesture.
class HoverOverlayRecipe : public Recipe {
public:
  HoverOverlayRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "overlay"; }
  LayerFrame draw() const override;

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
