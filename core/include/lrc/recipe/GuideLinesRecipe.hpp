#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Thin horizontal lines at the range bounds, each backed by a wider
// invisible hit band that drags that bound. Hidden without a range and in
// full-range mode.
class GuideLinesRecipe : public Recipe {
public:
  GuideLinesRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "guideLines"; }
  LayerFrame draw() const override;

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
