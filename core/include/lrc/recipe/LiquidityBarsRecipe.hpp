#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Horizontal liquidity depth bars in the gutter, one per tick band, growing
// leftwards from the indicator. Bars inside the selected range use the
// active color; the hovered band is drawn on top in the hover color.
class LiquidityBarsRecipe : public Recipe {
public:
  LiquidityBarsRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "liquidityBars"; }
  LayerFrame draw() const override;

  static constexpr std::size_t kInactive = 0;
  static constexpr std::size_t kActive = 1;
  static constexpr std::size_t kHover = 2;

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
