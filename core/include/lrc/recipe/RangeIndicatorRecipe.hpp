#pragma once
#include "lrc/recipe/Recipe.hpp"

namespace lrc {

// Sidebar range indicator: a full-height track, the selected-range bar
// (never shorter than rangeMinHeight), circular min/max handles and a
// center grip. Only the track is shown in full-range mode.
class RangeIndicatorRecipe : public Recipe {
public:
  RangeIndicatorRecipe(Id idBase, Id paneId, const ChartReader& reader);

  const char* name() const override { return "rangeIndicator"; }
  LayerFrame draw() const override;

  static constexpr std::size_t kTrack = 0;
  static constexpr std::size_t kBar = 1;
  static constexpr std::size_t kHandleStroke = 2;
  static constexpr std::size_t kHandleFill = 3;
  static constexpr std::size_t kGripStroke = 4;
  static constexpr std::size_t kGripFill = 5;
  static constexpr std::size_t kGripLines = 6;

  // Handle centers sit this far inside the bar ends.
  static constexpr double kHandleInset = 8.0;

protected:
  void appendBuildStyles(std::vector<CmdString>& out) const override;
};

} // namespace lrc
