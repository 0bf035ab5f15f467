#pragma once
#include "lrc/interaction/DragBehavior.hpp"
#include "lrc/state/ChartAccess.hpp"

namespace lrc {

// Hover tracking and drag-to-create over the liquidity gutter. Hover marks
// the band under the pointer; a vertical drag defines a new range between
// the start and current prices, clamped to the data bounds.
class CreateDrag : public DragBehavior {
public:
  CreateDrag(const ChartReader& reader, ChartActions& actions);

  // Pointer moved over the gutter with no button held.
  void hover(double y);
  // Pointer left the gutter.
  void leave();

  void onStart(double x, double y) override;
  void onDrag(double x, double y) override;
  void onEnd(double x, double y) override;
  bool active() const override { return active_; }

  // Range spanned by a drag from startY to endY. False when either end maps
  // to a non-positive or non-finite price or the clamped span is empty.
  bool computeRange(double startY, double endY, double& outMin, double& outMax) const;

private:
  const ChartReader& reader_;
  ChartActions& actions_;
  bool active_{false};
};

} // namespace lrc
