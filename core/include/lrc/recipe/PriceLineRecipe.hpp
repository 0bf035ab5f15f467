#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Historical price line across the plot. The full line is drawn in the
// out-of-range color; a second copy in the in-range color is scissored to
// the band between the min and max prices. A two-ring dot marks the last
// sample, colored by whether it lies inside the range.
class PriceLineRecipe : public Recipe {
public:
  PriceLineRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "priceLine"; }
  LayerFrame draw() const override;

  static constexpr std::size_t kBaseLine = 0;
  static constexpr std::size_t kActiveLine = 1;
  static constexpr std::size_t kDotOuter = 2;
  static constexpr std::size_t kDotInner = 3;

  // Scissor rect used for the in-range copy; disabled when no range is set.
  ScissorRect activeMask() const;

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
