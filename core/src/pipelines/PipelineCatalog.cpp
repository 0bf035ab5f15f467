#include "lrc/pipelines/PipelineCatalog.hpp"

namespace lrc {

namespace {

constexpr PipelineSpec kPipelines[] = {
  {"triSolid@1", VertexFormat::Pos2, 3},
  {"line2d@1", VertexFormat::Pos2, 2},
  {"instancedRect@1", VertexFormat::Rect4, 1},
  {"lineAA@1", VertexFormat::Rect4, 1},
};

} // namespace

const PipelineSpec* PipelineCatalog::find(const std::string& key) const {
  for (const PipelineSpec& spec : kPipelines) {
    if (key == spec.key) return &spec;
  }
  return nullptr;
}

} // namespace lrc
