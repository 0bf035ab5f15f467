#pragma once
#include <cstdint>

namespace lrc {

enum class KeyCode : std::uint8_t {
  None = 0, Plus, Minus, C, F, R, Escape
};

enum class PointerAction : std::uint8_t {
  Move = 0, Down, Up, Wheel, Leave
};

enum class PointerButton : std::uint8_t {
  None = 0, Left, Middle, Right
};

// Generic pointer event, NOT GLFW-specific. Pixels, 0=left/top of the chart.
struct PointerEvent {
  PointerAction action{PointerAction::Move};
  PointerButton button{PointerButton::None};
  double x{0}, y{0};
  double wheelDelta{0};  // notches; positive = zoom in
  bool shift{false};
  bool ctrl{false};
};

} // namespace lrc
