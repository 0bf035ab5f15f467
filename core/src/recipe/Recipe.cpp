#include "lrc/recipe/Recipe.hpp"
#include <cstdio>

namespace lrc {

Recipe::Recipe(Id idBase, Id paneId, const ChartReader& reader)
  : idBase_(idBase), paneId_(paneId), reader_(reader) {}

std::size_t Recipe::addSlot(const std::string& slotName, const std::string& pipeline,
                            VertexFormat format) {
  slots_.push_back(Slot{slotName, pipeline, format});
  return slots_.size() - 1;
}

std::vector<Id> Recipe::drawItemIds() const {
  std::vector<Id> out;
  out.reserve(slots_.size());
  for (std::size_t k = 0; k < slots_.size(); k++) out.push_back(drawItemId(k));
  return out;
}

RecipeBuildResult Recipe::build() const {
  RecipeBuildResult result;
  auto idStr = [](Id id) { return std::to_string(id); };

  result.createCommands.push_back(
    R"({"cmd":"createLayer","id":)" + idStr(layerId()) +
    R"(,"paneId":)" + idStr(paneId_) +
    R"(,"name":")" + name() + R"("})");

  for (std::size_t k = 0; k < slots_.size(); k++) {
    const Slot& s = slots_[k];
    result.createCommands.push_back(
      R"({"cmd":"createBuffer","id":)" + idStr(bufferId(k)) + R"(,"byteLength":0})");
    result.createCommands.push_back(
      R"({"cmd":"createGeometry","id":)" + idStr(geometryId(k)) +
      R"(,"vertexBufferId":)" + idStr(bufferId(k)) +
      R"(,"format":")" + toString(s.format) + R"(","vertexCount":0})");
    result.createCommands.push_back(
      R"({"cmd":"createDrawItem","id":)" + idStr(drawItemId(k)) +
      R"(,"layerId":)" + idStr(layerId()) +
      R"(,"name":")" + std::string(name()) + "_" + s.name + R"("})");
    result.createCommands.push_back(
      R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(drawItemId(k)) +
      R"(,"pipeline":")" + s.pipeline + R"(","geometryId":)" + idStr(geometryId(k)) + "}");
  }

  appendBuildStyles(result.createCommands);

  // Dispose: the layer cascades its draw items; buffers/geometries go separately.
  result.disposeCommands.push_back(
    R"({"cmd":"delete","id":)" + idStr(layerId()) + "}");
  for (std::size_t k = slots_.size(); k-- > 0;) {
    result.disposeCommands.push_back(
      R"({"cmd":"delete","id":)" + idStr(geometryId(k)) + "}");
    result.disposeCommands.push_back(
      R"({"cmd":"delete","id":)" + idStr(bufferId(k)) + "}");
  }

  return result;
}

LayerFrame Recipe::beginFrame() const {
  LayerFrame frame;
  frame.layerId = layerId();
  frame.writes.reserve(slots_.size());
  for (std::size_t k = 0; k < slots_.size(); k++) {
    BufferWrite w;
    w.bufferId = bufferId(k);
    w.geometryId = geometryId(k);
    frame.writes.push_back(std::move(w));
  }
  return frame;
}

void Recipe::setSlotData(LayerFrame& frame, std::size_t slot, std::vector<float> data) const {
  if (slot >= frame.writes.size()) return;
  std::uint32_t floatsPerVertex = slots_[slot].format == VertexFormat::Rect4 ? 4u : 2u;
  BufferWrite& w = frame.writes[slot];
  w.vertexCount = static_cast<std::uint32_t>(data.size() / floatsPerVertex);
  w.data = std::move(data);
}

CmdString Recipe::styleCommand(Id drawItemId, const float color[4], float lineWidth) {
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemStyle","drawItemId":%llu,"r":%.9g,"g":%.9g,"b":%.9g,"a":%.9g,"lineWidth":%.9g})",
    static_cast<unsigned long long>(drawItemId),
    static_cast<double>(color[0]), static_cast<double>(color[1]),
    static_cast<double>(color[2]), static_cast<double>(color[3]),
    static_cast<double>(lineWidth));
  return buf;
}

CmdString Recipe::scissorCommand(Id drawItemId, const ScissorRect& rect) {
  if (!rect.enabled) {
    return R"({"cmd":"setDrawItemScissor","drawItemId":)" + std::to_string(drawItemId) +
           R"(,"enabled":false})";
  }
  char buf[256];
  std::snprintf(buf, sizeof(buf),
    R"({"cmd":"setDrawItemScissor","drawItemId":%llu,"enabled":true,"x":%.9g,"y":%.9g,"w":%.9g,"h":%.9g})",
    static_cast<unsigned long long>(drawItemId),
    static_cast<double>(rect.x), static_cast<double>(rect.y),
    static_cast<double>(rect.w), static_cast<double>(rect.h));
  return buf;
}

} // namespace lrc
