#pragma once
#include "qc/ids/Id.hpp"
#include "qc/pipelines/PipelineCatalog.hpp"
#include "qc/scene/ResourceRegistry.hpp"
#include "qc/scene/Scene.hpp"

#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace qc {

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_GEOMETRY"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
};

// Applies JSON scene commands:
//   createPane, createLayer, createDrawItem, delete,
//   createBuffer, createGeometry, bindDrawItem, setDrawItemStyle,
//   createTransform, setTransform, attachTransform
class CommandProcessor {
public:
  CommandProcessor(Scene& scene, ResourceRegistry& registry);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Apply in order, stopping at the first failure.
  CmdResult applyAll(const std::vector<std::string>& commands);

  // Resource ids by kind, as a JSON string (for logging / tests).
  std::string listResourcesJson() const;

private:
  Scene& scene_;
  ResourceRegistry& reg_;
  PipelineCatalog catalog_;

  // ---- handlers ----
  CmdResult cmdCreatePane(const rapidjson::Value& obj);
  CmdResult cmdCreateLayer(const rapidjson::Value& obj);
  CmdResult cmdCreateDrawItem(const rapidjson::Value& obj);
  CmdResult cmdDelete(const rapidjson::Value& obj);

  CmdResult cmdCreateBuffer(const rapidjson::Value& obj);
  CmdResult cmdCreateGeometry(const rapidjson::Value& obj);
  CmdResult cmdBindDrawItem(const rapidjson::Value& obj);
  CmdResult cmdSetDrawItemStyle(const rapidjson::Value& obj);

  CmdResult cmdCreateTransform(const rapidjson::Value& obj);
  CmdResult cmdSetTransform(const rapidjson::Value& obj);
  CmdResult cmdAttachTransform(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static bool getFloat(const rapidjson::Value& obj, const char* key, float& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult created(Id id);

  // Reserve a caller id or allocate one.
  bool claimId(const rapidjson::Value& obj, ResourceKind kind, Id& out);

  CmdResult validateDrawItem(const DrawItem& di) const;
};

} // namespace qc
