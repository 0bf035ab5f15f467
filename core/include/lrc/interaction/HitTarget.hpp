#pragma once
#include <cstdint>
#include <vector>

namespace lrc {

enum class HitKind : std::uint8_t {
  None = 0,
  MinHandle,
  MaxHandle,
  CenterHandle,
  CreateOverlay
};

enum class CursorShape : std::uint8_t {
  Default = 0,
  Crosshair,
  ResizeVertical,
  Move
};

// Axis-aligned pointer region emitted by an interactive layer (pixels,
// top-left origin, edges inclusive).
struct HitTarget {
  HitKind kind{HitKind::None};
  double x0{0}, y0{0}, x1{0}, y1{0};
  CursorShape cursor{CursorShape::Default};

  bool contains(double x, double y) const {
    return x >= x0 && x <= x1 && y >= y0 && y <= y1;
  }
};

// Topmost target containing (x, y): the last one in draw order.
inline const HitTarget* findTopmost(const std::vector<HitTarget>& targets, double x, double y) {
  for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
    if (it->contains(x, y)) return &*it;
  }
  return nullptr;
}

} // namespace lrc
