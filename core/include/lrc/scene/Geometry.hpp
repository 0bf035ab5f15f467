#pragma once
#include "lrc/ids/Id.hpp"
#include <cstdint>

namespace lrc {

enum class VertexFormat : std::uint8_t {
  Pos2 = 1,   // vec2 position, pixels
  Rect4 = 2   // (x0, y0, x1, y1) per instance, pixels
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2: return "pos2";
    case VertexFormat::Rect4: return "rect4";
    default: return "unknown";
  }
}

inline std::uint32_t strideOf(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2: return 2 * sizeof(float);
    case VertexFormat::Rect4: return 4 * sizeof(float);
    default: return 0;
  }
}

struct Buffer {
  Id id{0};
  std::uint32_t byteLength{0};
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2};
  std::uint32_t vertexCount{0}; // vertices, or instances for Rect4
};

} // namespace lrc
