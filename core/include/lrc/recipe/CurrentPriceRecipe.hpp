#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Dashed horizontal reference line at the current price. Not interactive.
class CurrentPriceRecipe : public Recipe {
public:
  CurrentPriceRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "currentPrice"; }
  LayerFrame draw() const override;

  static constexpr double kDash = 4.0;
  static constexpr double kGap = 4.0;

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
