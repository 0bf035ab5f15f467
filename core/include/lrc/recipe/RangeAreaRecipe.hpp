#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Shaded band between the min and max prices across the plot and gutter.
// Grabbing it moves the whole range, except in full-range mode.
class RangeAreaRecipe : public Recipe {
public:
  RangeAreaRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "rangeArea"; }
  LayerFrame draw() const override;

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
