#pragma once
#include "lrc/interaction/DragBehavior.hpp"
#include "lrc/state/ChartAccess.hpp"

namespace lrc {

// Moves the whole range, keeping its width in ticks. The range snaps to
// tick prices; a move that would push either end outside the data is
// rejected (the range stays where it was) instead of being clamped.
class CenterDrag : public DragBehavior {
public:
  CenterDrag(const ChartReader& reader, ChartActions& actions);

  void onStart(double x, double y) override;
  void onDrag(double x, double y) override;
  void onEnd(double x, double y) override;
  bool active() const override { return active_; }

  // Range for a pointer at y given the grab offset from onStart.
  // Returns false when the move is rejected.
  bool computeRange(double y, double& outMin, double& outMax) const;

  int tickSpan() const { return tickSpan_; }

private:
  const ChartReader& reader_;
  ChartActions& actions_;

  bool active_{false};
  double grabOffsetY_{0};
  int tickSpan_{0};
};

} // namespace lrc
