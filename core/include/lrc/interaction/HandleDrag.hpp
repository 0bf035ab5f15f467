#pragma once
#include "lrc/interaction/DragBehavior.hpp"
#include "lrc/state/ChartAccess.hpp"

namespace lrc {

// Drags one bound of the range (min or max). Moving a handle past the other
// swaps their roles; the pixel span never drops below rangeMinHeight.
// The range updates live; the host is notified once, at the end.
class HandleDrag : public DragBehavior {
public:
  HandleDrag(HandleType type, const ChartReader& reader, ChartActions& actions);

  void onStart(double x, double y) override;
  void onDrag(double x, double y) override;
  void onEnd(double x, double y) override;
  bool active() const override { return active_; }

  HandleType type() const { return type_; }

  // Range resulting from the handle at draggedY, measured against the
  // bounds captured at onStart. Returns false when no valid range results.
  bool computeRange(double draggedY, double& outMin, double& outMax) const;

private:
  double clampY(double y) const;

  HandleType type_;
  const ChartReader& reader_;
  ChartActions& actions_;

  bool active_{false};
  double initialMin_{0};
  double initialMax_{0};
  double grabOffset_{0};
};

} // namespace lrc
