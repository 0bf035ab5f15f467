#pragma once

namespace lrc {

// Pointer gesture bound to one interactive element. Coordinates are plot
// pixels. onEnd is delivered once per gesture that received onStart.
class DragBehavior {
public:
  virtual ~DragBehavior() = default;

  virtual void onStart(double x, double y) = 0;
  virtual void onDrag(double x, double y) = 0;
  virtual void onEnd(double x, double y) = 0;

  virtual bool active() const = 0;
};

} // namespace lrc
