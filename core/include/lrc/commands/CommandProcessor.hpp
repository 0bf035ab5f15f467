#pragma once
#include "lrc/ids/Id.hpp"
#include "lrc/pipelines/PipelineCatalog.hpp"
#include "lrc/scene/ResourceRegistry.hpp"
#include "lrc/scene/Scene.hpp"

#include <cstdint>
#include <string>

#include <rapidjson/document.h>

namespace lrc {

// Failure codes: BAD_COMMAND, UNKNOWN_COMMAND, NOT_FOUND, ID_TAKEN and the
// VALIDATION_* family (INVALID_PARENT, MISSING_GEOMETRY, BAD_PIPELINE,
// BAD_VERTEX_COUNT). `details` is a small JSON object naming the offending
// fields.
struct CmdError {
  std::string code;
  std::string message;
  std::string details;
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};  // set by the create* commands
};

// The only writer of the Scene. Recipes describe their resources and per-frame
// updates as JSON commands; this validates each one against the registry and
// the pipeline catalog and applies it or reports why not.
class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  CmdResult applyJson(const rapidjson::Value& obj);
  CmdResult applyJsonText(const std::string& jsonText);

  // {"panes":[...],"layers":[...],...,"frame":n,"inFrame":b}
  std::string listResourcesJson() const;

  std::uint64_t frameCounter() const { return frameCounter_; }
  const PipelineCatalog& catalog() const { return catalog_; }

private:
  using Handler = CmdResult (CommandProcessor::*)(const rapidjson::Value&);
  struct HandlerEntry {
    const char* name;
    Handler handler;
  };
  static const HandlerEntry kHandlers[];

  Scene& scene_;
  ResourceRegistry& reg_;
  PipelineCatalog catalog_;

  bool inFrame_{false};
  std::uint64_t frameCounter_{0};

  CmdResult cmdBeginFrame(const rapidjson::Value& obj);
  CmdResult cmdCommitFrame(const rapidjson::Value& obj);
  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);
  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemStyle(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemScissor(const rapidjson::Value& obj);
  CmdResult cmdSetGeometryVertexCount(const rapidjson::Value& obj);
  CmdResult cmdDelete(const rapidjson::Value& obj);

  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static CmdResult fail(const std::string& code, const std::string& message,
                        const std::string& detailsJson = "{}");
  Id reserveOrAllocate(Id requested, ResourceKind kind);
  CmdResult validateDrawItem(const DrawItem& di) const;
};

} // namespace lrc
