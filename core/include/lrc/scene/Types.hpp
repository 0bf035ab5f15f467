#pragma once
#include "lrc/ids/Id.hpp"
#include <string>

namespace lrc {

// What a registered id names; decides how `delete` cascades.
enum class ResourceKind : std::uint8_t { Pane, Layer, DrawItem, Buffer, Geometry };

struct Pane {
  Id id{0};
  std::string name;
};

struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

// Pixel-space clip rectangle (top-left origin).
struct ScissorRect {
  bool enabled{false};
  float x{0}, y{0}, w{0}, h{0};
};

// One drawable of a layer: a pipeline bound to a geometry, plus the style the
// recipes set every frame.
struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  std::string pipeline;  // PipelineCatalog key, "" until bound
  Id geometryId{0};

  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float lineWidth{1.0f};
  bool visible{true};
  ScissorRect scissor;
};

} // namespace lrc
