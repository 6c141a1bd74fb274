#include "qc/commands/CommandProcessor.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>
#include <vector>

namespace qc {

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

CmdResult CommandProcessor::created(Id id) {
  CmdResult r;
  r.ok = true;
  r.createdId = id;
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
  if (!v) return kInvalidId;
  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  return kInvalidId;
}

bool CommandProcessor::getFloat(const rapidjson::Value& obj, const char* key, float& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = static_cast<float>(v->GetDouble());
  return true;
}

bool CommandProcessor::claimId(const rapidjson::Value& obj, ResourceKind kind, Id& out) {
  Id id = getIdOrZero(obj, "id");
  if (id != 0) {
    if (!reg_.reserve(id, kind)) return false;
  } else {
    id = reg_.allocate(kind);
  }
  out = id;
  return true;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyAll(const std::vector<std::string>& commands) {
  CmdResult last;
  for (const auto& cmd : commands) {
    last = applyJsonText(cmd);
    if (!last.ok) return last;
  }
  return last;
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "createPane") return cmdCreatePane(obj);
  if (cmd == "createLayer") return cmdCreateLayer(obj);
  if (cmd == "createDrawItem") return cmdCreateDrawItem(obj);
  if (cmd == "delete") return cmdDelete(obj);

  if (cmd == "createBuffer") return cmdCreateBuffer(obj);
  if (cmd == "createGeometry") return cmdCreateGeometry(obj);
  if (cmd == "bindDrawItem") return cmdBindDrawItem(obj);
  if (cmd == "setDrawItemStyle") return cmdSetDrawItemStyle(obj);

  if (cmd == "createTransform") return cmdCreateTransform(obj);
  if (cmd == "setTransform") return cmdSetTransform(obj);
  if (cmd == "attachTransform") return cmdAttachTransform(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- scene graph --------------------

CmdResult CommandProcessor::cmdCreatePane(const rapidjson::Value& obj) {
  Id id = 0;
  if (!claimId(obj, ResourceKind::Pane, id)) {
    return fail("ID_TAKEN", "createPane: id already exists");
  }

  Pane p;
  p.id = id;
  p.name = getStringOrEmpty(obj, "name");
  if (const auto* cc = getMember(obj, "clearColor"); cc && cc->IsArray() && cc->Size() == 4) {
    for (rapidjson::SizeType i = 0; i < 4; i++) {
      if ((*cc)[i].IsNumber()) p.clearColor[i] = static_cast<float>((*cc)[i].GetDouble());
    }
    p.hasClearColor = true;
  }
  scene_.addPane(std::move(p));
  return created(id);
}

CmdResult CommandProcessor::cmdCreateLayer(const rapidjson::Value& obj) {
  const Id paneId = getIdOrZero(obj, "paneId");
  if (paneId == 0 || !scene_.hasPane(paneId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createLayer: invalid paneId",
                std::string(R"({"field":"paneId","paneId":)") + std::to_string(paneId) + "}");
  }

  Id id = 0;
  if (!claimId(obj, ResourceKind::Layer, id)) {
    return fail("ID_TAKEN", "createLayer: id already exists");
  }

  Layer l;
  l.id = id;
  l.paneId = paneId;
  l.name = getStringOrEmpty(obj, "name");
  scene_.addLayer(std::move(l));
  return created(id);
}

CmdResult CommandProcessor::cmdCreateDrawItem(const rapidjson::Value& obj) {
  const Id layerId = getIdOrZero(obj, "layerId");
  if (layerId == 0 || !scene_.hasLayer(layerId)) {
    return fail("VALIDATION_INVALID_PARENT",
                "createDrawItem: invalid layerId",
                std::string(R"({"field":"layerId","layerId":)") + std::to_string(layerId) + "}");
  }

  Id id = 0;
  if (!claimId(obj, ResourceKind::DrawItem, id)) {
    return fail("ID_TAKEN", "createDrawItem: id already exists");
  }

  DrawItem d;
  d.id = id;
  d.layerId = layerId;
  d.name = getStringOrEmpty(obj, "name");
  // pipeline + geometry bindings default empty/0; set by bindDrawItem
  scene_.addDrawItem(std::move(d));
  return created(id);
}

CmdResult CommandProcessor::cmdDelete(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  if (id == 0) {
    return fail("BAD_COMMAND", "delete: missing/invalid id");
  }

  ResourceKind kind;
  if (!reg_.kindOf(id, kind)) {
    return fail("NOT_FOUND",
                "delete: id does not exist",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  std::vector<Id> deleted;
  switch (kind) {
    case ResourceKind::Pane:      deleted = scene_.deletePane(id); break;
    case ResourceKind::Layer:     deleted = scene_.deleteLayer(id); break;
    case ResourceKind::DrawItem:  deleted = scene_.deleteDrawItem(id); break;
    case ResourceKind::Buffer:    deleted = scene_.deleteBuffer(id); break;
    case ResourceKind::Geometry:  deleted = scene_.deleteGeometry(id); break;
    case ResourceKind::Transform: deleted = scene_.deleteTransform(id); break;
  }

  if (deleted.empty()) {
    return fail("DELETE_FAILED",
                "delete: failed",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  for (Id did : deleted) {
    reg_.release(did);
  }
  return created(0);
}

// -------------------- geometry plumbing --------------------

CmdResult CommandProcessor::cmdCreateBuffer(const rapidjson::Value& obj) {
  const auto* bl = getMember(obj, "byteLength");
  if (!bl || !bl->IsUint()) {
    return fail("BAD_COMMAND", "createBuffer: missing uint byteLength");
  }

  Id id = 0;
  if (!claimId(obj, ResourceKind::Buffer, id)) {
    return fail("ID_TAKEN", "createBuffer: id already exists");
  }

  Buffer b;
  b.id = id;
  b.byteLength = bl->GetUint();
  scene_.addBuffer(b);
  return created(id);
}

CmdResult CommandProcessor::cmdCreateGeometry(const rapidjson::Value& obj) {
  const Id vb = getIdOrZero(obj, "vertexBufferId");
  if (vb == 0 || !scene_.hasBuffer(vb)) {
    return fail("MISSING_BUFFER",
                "createGeometry: invalid vertexBufferId",
                std::string(R"({"field":"vertexBufferId","vertexBufferId":)") + std::to_string(vb) + "}");
  }

  const auto* vc = getMember(obj, "vertexCount");
  if (!vc || !vc->IsUint()) {
    return fail("BAD_COMMAND", "createGeometry: missing uint vertexCount");
  }

  VertexFormat fmt = VertexFormat::Pos2Color4;
  if (const auto* f = getMember(obj, "format"); f && f->IsString()) {
    if (!parseVertexFormat(f->GetString(), fmt)) {
      return fail("UNSUPPORTED_VERTEX_FORMAT",
                  "createGeometry: unknown format",
                  R"({"supported":["pos2_color4","rect4_color4","glyph12"]})");
    }
  }

  Id id = 0;
  if (!claimId(obj, ResourceKind::Geometry, id)) {
    return fail("ID_TAKEN", "createGeometry: id already exists");
  }

  Geometry g;
  g.id = id;
  g.vertexBufferId = vb;
  g.format = fmt;
  g.vertexCount = vc->GetUint();
  scene_.addGeometry(g);
  return created(id);
}

CmdResult CommandProcessor::cmdBindDrawItem(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  if (drawItemId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing/invalid drawItemId");
  }

  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "bindDrawItem: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  const std::string pipeline = getStringOrEmpty(obj, "pipeline");
  if (pipeline.empty()) {
    return fail("BAD_COMMAND", "bindDrawItem: missing pipeline");
  }

  const Id geomId = getIdOrZero(obj, "geometryId");
  if (geomId == 0) {
    return fail("BAD_COMMAND", "bindDrawItem: missing geometryId");
  }

  di->pipeline = pipeline;
  di->geometryId = geomId;
  return validateDrawItem(*di);
}

CmdResult CommandProcessor::cmdSetDrawItemStyle(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "setDrawItemStyle: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  getFloat(obj, "r", di->color[0]);
  getFloat(obj, "g", di->color[1]);
  getFloat(obj, "b", di->color[2]);
  getFloat(obj, "a", di->color[3]);

  float lw = 0.0f;
  if (getFloat(obj, "lineWidth", lw)) {
    if (lw <= 0.0f) {
      return fail("BAD_COMMAND", "setDrawItemStyle: lineWidth must be > 0");
    }
    di->lineWidth = lw;
  }
  return created(0);
}

// -------------------- transforms --------------------

CmdResult CommandProcessor::cmdCreateTransform(const rapidjson::Value& obj) {
  Id id = 0;
  if (!claimId(obj, ResourceKind::Transform, id)) {
    return fail("ID_TAKEN", "createTransform: id already exists");
  }

  Transform t;
  t.id = id;
  scene_.addTransform(t);
  return created(id);
}

CmdResult CommandProcessor::cmdSetTransform(const rapidjson::Value& obj) {
  const Id id = getIdOrZero(obj, "id");
  Transform* t = scene_.getTransformMutable(id);
  if (!t) {
    return fail("MISSING_TRANSFORM",
                "setTransform: id does not exist",
                std::string(R"({"id":)") + std::to_string(id) + "}");
  }

  // x' = sx * x + tx,  y' = sy * y + ty
  float sx = 1.0f, sy = 1.0f, tx = 0.0f, ty = 0.0f;
  getFloat(obj, "sx", sx);
  getFloat(obj, "sy", sy);
  getFloat(obj, "tx", tx);
  getFloat(obj, "ty", ty);

  const float m[9] = {sx, 0, 0, 0, sy, 0, tx, ty, 1};
  for (int i = 0; i < 9; i++) t->mat3[i] = m[i];
  return created(0);
}

CmdResult CommandProcessor::cmdAttachTransform(const rapidjson::Value& obj) {
  const Id drawItemId = getIdOrZero(obj, "drawItemId");
  DrawItem* di = scene_.getDrawItemMutable(drawItemId);
  if (!di) {
    return fail("MISSING_DRAWITEM",
                "attachTransform: drawItemId does not exist",
                std::string(R"({"drawItemId":)") + std::to_string(drawItemId) + "}");
  }

  const Id transformId = getIdOrZero(obj, "transformId");
  if (transformId == 0 || !scene_.hasTransform(transformId)) {
    return fail("MISSING_TRANSFORM",
                "attachTransform: transformId does not exist",
                std::string(R"({"transformId":)") + std::to_string(transformId) + "}");
  }

  di->transformId = transformId;
  return created(0);
}

// -------------------- validation --------------------

CmdResult CommandProcessor::validateDrawItem(const DrawItem& di) const {
  const PipelineSpec* spec = catalog_.find(di.pipeline);
  if (!spec) {
    return fail("UNKNOWN_PIPELINE",
                "drawItem pipeline not found",
                std::string(R"({"pipeline":")") + di.pipeline + R"("})");
  }

  const Geometry* g = scene_.getGeometry(di.geometryId);
  if (!g) {
    return fail("VALIDATION_BAD_GEOMETRY",
                "drawItem geometryId does not exist",
                std::string(R"({"geometryId":)") + std::to_string(di.geometryId) + "}");
  }

  const Buffer* b = scene_.getBuffer(g->vertexBufferId);
  if (!b) {
    return fail("VALIDATION_MISSING_BUFFER",
                "geometry must reference an existing vertexBufferId",
                std::string(R"({"vertexBufferId":)") + std::to_string(g->vertexBufferId) + "}");
  }

  if (g->format != spec->requiredVertexFormat) {
    return fail("VALIDATION_VERTEX_FORMAT_MISMATCH",
                "geometry vertex format does not match pipeline requirement",
                std::string(R"({"pipeline":")") + di.pipeline +
                  R"(","required":")" + toString(spec->requiredVertexFormat) +
                  R"(","got":")" + toString(g->format) + R"("})");
  }

  if (!spec->instanced && (g->vertexCount % spec->vertexMultiple) != 0u) {
    return fail("VALIDATION_BAD_VERTEX_COUNT",
                "vertexCount is not a multiple of the primitive size",
                std::string(R"({"vertexCount":)") + std::to_string(g->vertexCount) + "}");
  }

  const std::uint64_t needed =
      static_cast<std::uint64_t>(g->vertexCount) * strideOf(g->format);
  if (needed > b->byteLength) {
    return fail("VALIDATION_BUFFER_TOO_SMALL",
                "buffer is smaller than vertexCount * stride",
                std::string(R"({"needed":)") + std::to_string(needed) +
                  R"(,"byteLength":)" + std::to_string(b->byteLength) + "}");
  }

  CmdResult r;
  r.ok = true;
  r.createdId = 0;
  return r;
}

// -------------------- Query --------------------

std::string CommandProcessor::listResourcesJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  auto writeKind = [&](const char* key, ResourceKind kind) {
    w.Key(key);
    w.StartArray();
    for (Id id : reg_.list(kind)) w.Uint64(id);
    w.EndArray();
  };

  w.StartObject();
  writeKind("panes", ResourceKind::Pane);
  writeKind("layers", ResourceKind::Layer);
  writeKind("drawItems", ResourceKind::DrawItem);
  writeKind("buffers", ResourceKind::Buffer);
  writeKind("geometries", ResourceKind::Geometry);
  writeKind("transforms", ResourceKind::Transform);
  w.EndObject();

  return sb.GetString();
}

} // namespace qc
