#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Time axis under the plot: short tick marks plus up to kMaxLabels text
// labels, formatted for the current history duration.
class TimeAxisRecipe : public Recipe {
public:
  TimeAxisRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "timeAxis"; }
  LayerFrame draw() const override;

  static constexpr int kMaxLabels = 4;
  static constexpr double kTickLength = 4.0;

  bool utc{true};

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
