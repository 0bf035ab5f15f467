#include "lrc/commands/CommandProcessor.hpp"
#include "lrc/scene/Geometry.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <vector>

namespace lrc {

const CommandProcessor::HandlerEntry CommandProcessor::kHandlers[] = {
  {"beginFrame", &CommandProcessor::cmdBeginFrame},
  {"commitFrame", &CommandProcessor::cmdCommitFrame},
  {"createPane", &CommandProcessor::cmdCreatePane},
  {"createLayer", &CommandProcessor::cmdCreateLayer},
  {"createDrawItem", &CommandProcessor::cmdCreateDrawItem},
  {"createBuffer", &CommandProcessor::cmdCreateBuffer},
  {"createGeometry", &CommandProcessor::cmdCreateGeometry},
  {"bindDrawItem", &CommandProcessor::cmdBindDrawItem},
  {"setDrawItemStyle", &CommandProcessor::cmdSetDrawItemStyle},
  {"setDrawItemScissor", &CommandProcessor::cmdSetDrawItemScissor},
  {"setGeometryVertexCount", &CommandProcessor::cmdSetGeometryVertexCount},
  {"delete", &CommandProcessor::cmdDelete},
};

CommandProcessor::CommandProcessor(Scene& scene, ResourceRegistry& registry)
  : scene_(scene), reg_(registry) {}

CmdResult CommandProcessor::fail(const std::string& code,
                                 const std::string& message,
                                 const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  r.createdId = 0;
  return r;
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string CommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

Id CommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<Id>(v->GetInt64());
  if (v->IsString()) {
    Id id = 0;
    return parseIdString(v->GetString(), id) ? id : 0;
  }
  return 0;
}

// 0 when the requested id is already taken.
Id CommandProcessor::reserveOrAllocate(Id requested, ResourceKind kind) {
  if (requested == 0) return reg_.allocate(kind);
  return reg_.reserve(requested, kind) ? requested : 0;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  for (const auto& entry : kHandlers) {
    if (cmd == entry.name) return (this->*entry.handler)(obj);
  }

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- frames --------------------

CmdResult CommandProcessor::cmdBeginFrame(const rapidjson::Value&) {
  if (inFrame_) {
    return fail("BAD_COMMAND", "beginFrame: already in frame");
  }
  inFrame_ = true;
  frameCounter_++;
  return CmdResult{};
}

CmdResult CommandProcessor::cmdCommitFrame(const rapidjson::Value&) {
  if (!inFrame_) {
    return fail("BAD_COMMAND", "commitFrame: not in frame");
  }
  inFrame_ = false;
  return CmdResult{};
}

// -------------------- graph --------------------

CmdResult CommandProcessor::cmdCreatePane(const rapidjson::Value& obj) {
  Id id = reserveOrAllocate(getIdOrZero(obj, "id"), ResourceKind::Pane);
  if (id == 0) return fail("ID_TAKEN", "createPane: id already exists");

  Pane p;
  p.id = id;
  p.name = getStringOrEmpty(obj, "name");
  scene_.addPane(std::move(p));

  CmdResult r;
  r.createdId = id;
  return r;
}

CmdResult CommandProcessor::cmdCreateLayer(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !scene_.hasPane(paneId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createLayer: invalid paneId",
                std::string(R"({"field":"paneId","paneId":)") + std::to_string(paneId) + "}");
  }

  Id id = reserveOrAllocate(getIdOrZero(obj, "id"), ResourceKind::Layer);
  if (id == 0) return fail("ID_TAKEN", "createLayer: id already exists");

  Layer l;
  l.id = id;
  l.paneId = paneId;
  l.name = getStringOrEmpty(obj, "name");
  scene_.addLayer(std::move(l));

  CmdResult r;
  r.createdId = id;
  return r;
}

CmdResult CommandProcessor::cmdCreateDrawItem(const rapidjson::Value& obj) {
  const Id layerId = getIdOrZero(obj, "layerId");
  if (layerId == 0 || !scene_.hasLayer(layerId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createDrawItem: invalid layerId",
                std::string(R"({"field":"layerId","layerId":)") + std::to_string(layerId) + "}");
  }

  Id id = reserveOrAllocate(getIdOrZero(obj, "id"), ResourceKind::DrawItem);
  if (id == 0) return fail("ID_TAKEN", "createDrawItem: id already exists");

  DrawItem d;
  d.id = id;
  d.layerId = layerId;
  d.name = getStringOrEmpty(obj, "name");
  // pipeline + geometry bindings default empty/0; set by bindDrawItem
  scene_.addDrawItem(std::move(d));

  CmdResult r;
  r.createdId = id;
  return r;
}

CmdResult CommandProcessor::cmdDelete(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0) {
    return fail("BAD_COMMAND", "delete: missing/invalid id");
  }

  ResourceKind kind;
  if (!reg_.lookup(id, kind)) {
    return fail("NOT_FOUND",
                "delete: id does not exist",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  std::vector<Id> deleted;
  switch (kind) {
    case ResourceKind::Pane:     deleted = scene_.deletePane(id); break;
    case ResourceKind::Layer:    deleted = scene_.deleteLayer(id); break;
    case ResourceKind::DrawItem: deleted = scene_.deleteDrawItem(id); break;
    case ResourceKind::Buffer:   deleted = scene_.deleteBuffer(id); break;
    case ResourceKind::Geometry: deleted = scene_.deleteGeometry(id); break;
  }

  if (deleted.empty()) {
    // registered but never materialized in the scene
    reg_.release(id);
    return fail("NOT_FOUND",
                "delete: id has no scene object",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  for (Id did : deleted) {
    reg_.release(did);
  }
  return CmdResult{};
}

// -------------------- resources --------------------

CmdResult CommandProcessor::cmdCreateBuffer(const rapidjson::Value& obj) {
  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "createBuffer: missing uint byteLength");
  }

  Id id = reserveOrAllocate(getIdOrZero(obj, "id"), ResourceKind::Buffer);
  if (id == 0) return fail("ID_TAKEN", "createBuffer: id already exists");

  Buffer b;
  b.id = id;
  b.byteLength = bl->GetUint();
  scene_.addBuffer(std::move(b));

  CmdResult r;
  r.createdId = id;
  return r;
}

CmdResult CommandProcessor::cmdCreateGeometry(const rapidjson::Value& obj) {
  const Id vb = getIdOrZero(obj, "vertexBufferId");
  if (vb == 0 || !scene_.hasBuffer(vb)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createGeometry: invalid vertexBufferId",
                std::string(R"({"field":"vertexBufferId","vertexBufferId":)") + std::to_string(vb) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "createGeometry: missing uint vertexCount");
  }

  VertexFormat fmt = VertexFormat::Pos2;
  const std::string f = getStringOrEmpty(obj, "format");
  if (f == "rect4") {
    fmt = VertexFormat::Rect4;
  } else if (!f.empty() && f != "pos2") {
    return fail("BAD_COMMAND",
                "createGeometry: unsupported format",
                R"({"supported":["pos2","rect4"]})");
  }

  Id id = reserveOrAllocate(getIdOrZero(obj, "id"), ResourceKind::Geometry);
  if (id == 0) return fail("ID_TAKEN", "createGeometry: id already exists");

  Geometry g;
  g.id = id;
  g.vertexBufferId = vb;
  g.format = fmt;
  g.vertexCount = vc->GetUint();
  scene_.addGeometry(std::move(g));

  CmdResult r;
  r.createdId = id;
  return r;
}

CmdResult CommandProcessor::cmdBindDrawItem(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = drawItemId ? scene_.getDrawItemMutable(drawItemId) : nullptr;
  if (!di) {
    return fail("NOT_FOUND",
                "bindDrawItem: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  DrawItem candidate = *di;
  candidate.pipeline = getStringOrEmpty(obj, "pipeline");
  candidate.geometryId = getIdOrZero(obj, "geometryId");

  CmdResult v = validateDrawItem(candidate);
  if (!v.ok) return v;

  di->pipeline = candidate.pipeline;
  di->geometryId = candidate.geometryId;
  return CmdResult{};
}

CmdResult CommandProcessor::validateDrawItem(const DrawItem& di) const {
  const PipelineSpec* spec = catalog_.find(di.pipeline);
  if (!spec) {
    return fail("VALIDATION_BAD_PIPELINE",
                "drawItem pipeline not found",
                std::string(R"({"pipeline":")") + di.pipeline + R"("})");
  }

  const Geometry* g = di.geometryId ? scene_.getGeometry(di.geometryId) : nullptr;
  if (!g) {
    return fail("VALIDATION_MISSING_GEOMETRY",
                "drawItem must bind an existing geometryId",
                std::string(R"({"drawItemId":)") + std::to_string(di.id) +
                  R"(,"geometryId":)" + std::to_string(di.geometryId) + "}");
  }

  if (g->format != spec->vertexFormat) {
    return fail("VALIDATION_BAD_PIPELINE",
                "geometry vertex format does not match pipeline requirement",
                std::string(R"({"pipeline":")") + di.pipeline +
                  R"(","required":")" + toString(spec->vertexFormat) +
                  R"(","got":")" + toString(g->format) + R"("})");
  }

  return CmdResult{};
}

// -------------------- per-frame updates --------------------

CmdResult CommandProcessor::cmdSetDrawItemStyle(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = drawItemId ? scene_.getDrawItemMutable(drawItemId) : nullptr;
  if (!di) {
    return fail("NOT_FOUND",
                "setDrawItemStyle: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  static const char* kChannels[4] = {"r", "g", "b", "a"};
  for (int i = 0; i < 4; i++) {
    const auto* v = getMember(obj, kChannels[i]);
    if (v && v->IsNumber()) di->color[i] = static_cast<float>(v->GetDouble());
  }
  if (const auto* v = getMember(obj, "lineWidth"); v && v->IsNumber())
    di->lineWidth = static_cast<float>(v->GetDouble());
  if (const auto* v = getMember(obj, "visible"); v && v->IsBool())
    di->visible = v->GetBool();

  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetDrawItemScissor(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = drawItemId ? scene_.getDrawItemMutable(drawItemId) : nullptr;
  if (!di) {
    return fail("NOT_FOUND",
                "setDrawItemScissor: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  const auto* en = getMember(obj, "enabled");
  if (!en || !en->IsBool()) {
    return fail("BAD_COMMAND", "setDrawItemScissor: missing bool enabled");
  }

  ScissorRect s;
  s.enabled = en->GetBool();
  if (s.enabled) {
    const char* keys[4] = {"x", "y", "w", "h"};
    float* dst[4] = {&s.x, &s.y, &s.w, &s.h};
    for (int i = 0; i < 4; i++) {
      const auto* v = getMember(obj, keys[i]);
      if (!v || !v->IsNumber()) {
        return fail("BAD_COMMAND",
                    "setDrawItemScissor: missing numeric field",
                    std::string(R"({"field":")") + keys[i] + R"("})");
      }
      *dst[i] = static_cast<float>(v->GetDouble());
    }
    if (s.w < 0.0f || s.h < 0.0f) {
      return fail("BAD_COMMAND", "setDrawItemScissor: negative size");
    }
  }
  di->scissor = s;
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetGeometryVertexCount(const rapidjson::Value& obj) {
  const Id geomId = getIdOrZero(obj, "geometryId");
  Geometry* g = geomId ? scene_.getGeometryMutable(geomId) : nullptr;
  if (!g) {
    return fail("NOT_FOUND",
                "setGeometryVertexCount: geometryId does not exist",
                std::string(R"({"geometryId":)") + std::to_string(geomId) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "setGeometryVertexCount: missing uint vertexCount");
  }
  const std::uint32_t count = vc->GetUint();

  // every pipeline drawing this geometry must get whole primitives
  for (Id diId : scene_.drawItemIds()) {
    const DrawItem* di = scene_.getDrawItem(diId);
    if (di->geometryId != geomId) continue;
    const PipelineSpec* spec = catalog_.find(di->pipeline);
    if (spec && count % spec->vertexMultiple != 0) {
      return fail("VALIDATION_BAD_VERTEX_COUNT",
                  "setGeometryVertexCount: count is not a whole number of primitives",
                  std::string(R"({"pipeline":")") + spec->key +
                    R"(","vertexCount":)" + std::to_string(count) + "}");
    }
  }
  g->vertexCount = count;
  return CmdResult{};
}

// -------------------- Query --------------------

std::string CommandProcessor::listResourcesJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto writeList = [&](const char* key, ResourceKind kind) {
    w.Key(key);
    w.StartArray();
    for (Id id : reg_.list(kind)) w.Uint64(id);
    w.EndArray();
  };

  w.StartObject();
  writeList("panes", ResourceKind::Pane);
  writeList("layers", ResourceKind::Layer);
  writeList("drawItems", ResourceKind::DrawItem);
  writeList("buffers", ResourceKind::Buffer);
  writeList("geometries", ResourceKind::Geometry);

  w.Key("frame");
  w.Uint64(frameCounter_);
  w.Key("inFrame");
  w.Bool(inFrame_);
  w.EndObject();

  return sb.GetString();
}

} // namespace lrc
