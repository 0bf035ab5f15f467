#pragma once
#include "lrc/scene/Geometry.hpp"
#include <cstdint>
#include <string>

namespace lrc {

// What bindDrawItem and setGeometryVertexCount check a draw against.
struct PipelineSpec {
  const char* key;             // name@version
  VertexFormat vertexFormat;   // geometry format the shader reads
  std::uint32_t vertexMultiple;  // vertexCount must be a multiple of this
};

// The four pipelines the renderer implements:
//   triSolid@1       Pos2 triangles (areas, dots)
//   line2d@1         Pos2 line pairs, 1px (dashes, tick marks)
//   instancedRect@1  Rect4 per bar / handle
//   lineAA@1         Rect4 per segment, antialiased with a line width
class PipelineCatalog {
public:
  const PipelineSpec* find(const std::string& key) const;
};

} // namespace lrc
