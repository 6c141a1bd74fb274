#include "qc/recipe/LayerRecipe.hpp"
#include "qc/text/GlyphAtlas.hpp"
#include "qc/text/TextLayout.hpp"
#include <cstdio>
#include <map>
#include <string>

namespace qc {

namespace {

std::string idStr(Id id) { return std::to_string(id); }

void pushColor(std::vector<float>& out, const Rgba& c) {
  float f[4];
  c.toFloat4(f);
  out.insert(out.end(), f, f + 4);
}

} // namespace

LayerRecipe::LayerRecipe(Id idBase, const LayerRecipeConfig& config,
                         const LayerPrimitives& prims, const GlyphAtlas* atlas)
  : Recipe(idBase), config_(config), prims_(prims), atlas_(atlas) {}

void LayerRecipe::emitItem(RecipeBuildResult& result, std::uint32_t& slot,
                           const char* pipeline, const char* format,
                           std::uint32_t count, std::vector<float> data,
                           float lineWidth) const {
  const Id bufferId = rid(slot);
  const Id geometryId = rid(slot + 1);
  const Id drawItemId = rid(slot + 2);
  slot += kSlotsPerItem;

  const std::size_t bytes = data.size() * sizeof(float);

  result.createCommands.push_back(
    R"({"cmd":"createBuffer","id":)" + idStr(bufferId) +
    R"(,"byteLength":)" + std::to_string(bytes) + "}");

  result.createCommands.push_back(
    R"({"cmd":"createGeometry","id":)" + idStr(geometryId) +
    R"(,"vertexBufferId":)" + idStr(bufferId) +
    R"(,"format":")" + format + R"(","vertexCount":)" + std::to_string(count) + "}");

  result.createCommands.push_back(
    R"({"cmd":"createDrawItem","id":)" + idStr(drawItemId) +
    R"(,"layerId":)" + idStr(layerId()) +
    R"(,"name":")" + config_.name + "." + pipeline + R"("})");

  result.createCommands.push_back(
    R"({"cmd":"bindDrawItem","drawItemId":)" + idStr(drawItemId) +
    R"(,"pipeline":")" + pipeline + R"(","geometryId":)" + idStr(geometryId) + "}");

  if (lineWidth > 0.0f) {
    char styleBuf[160];
    std::snprintf(styleBuf, sizeof(styleBuf),
      R"({"cmd":"setDrawItemStyle","drawItemId":%s,"lineWidth":%.9g})",
      idStr(drawItemId).c_str(), static_cast<double>(lineWidth));
    result.createCommands.push_back(styleBuf);
  }

  if (config_.transformId) {
    result.createCommands.push_back(
      R"({"cmd":"attachTransform","drawItemId":)" + idStr(drawItemId) +
      R"(,"transformId":)" + idStr(config_.transformId) + "}");
  }

  result.buffers.push_back({bufferId, std::move(data)});

  result.disposeCommands.push_back(
    R"({"cmd":"delete","id":)" + idStr(geometryId) + "}");
  result.disposeCommands.push_back(
    R"({"cmd":"delete","id":)" + idStr(bufferId) + "}");
}

RecipeBuildResult LayerRecipe::build() const {
  RecipeBuildResult result;

  result.createCommands.push_back(
    R"({"cmd":"createLayer","id":)" + idStr(layerId()) +
    R"(,"paneId":)" + idStr(config_.paneId) +
    R"(,"name":")" + config_.name + R"("})");

  std::uint32_t slot = 1;

  if (!prims_.rects.empty()) {
    std::vector<float> data;
    data.reserve(prims_.rects.size() * 8);
    for (const auto& r : prims_.rects) {
      data.push_back(r.x0);
      data.push_back(r.y0);
      data.push_back(r.x1);
      data.push_back(r.y1);
      pushColor(data, r.color);
    }
    emitItem(result, slot, "colorRect@1", "rect4_color4",
             static_cast<std::uint32_t>(prims_.rects.size()), std::move(data), 0.0f);
  }

  if (!prims_.tris.empty()) {
    std::vector<float> data;
    data.reserve(prims_.tris.size() * 18);
    for (const auto& t : prims_.tris) {
      for (int v = 0; v < 3; v++) {
        data.push_back(t.x[v]);
        data.push_back(t.y[v]);
        pushColor(data, t.color);
      }
    }
    emitItem(result, slot, "colorTri@1", "pos2_color4",
             static_cast<std::uint32_t>(prims_.tris.size() * 3), std::move(data), 0.0f);
  }

  if (!prims_.lines.empty()) {
    // lineWidth is per draw item, so lines are grouped by width.
    std::map<float, std::vector<float>> byWidth;
    for (const auto& l : prims_.lines) {
      auto& data = byWidth[l.width];
      data.push_back(l.x0);
      data.push_back(l.y0);
      data.push_back(l.x1);
      data.push_back(l.y1);
      pushColor(data, l.color);
    }
    for (auto& kv : byWidth) {
      const auto count = static_cast<std::uint32_t>(kv.second.size() / 8);
      emitItem(result, slot, "lineAA@1", "rect4_color4", count,
               std::move(kv.second), kv.first);
    }
  }

  if (!prims_.texts.empty() && atlas_ && atlas_->fontLoaded()) {
    TextLayoutResult text;
    for (const auto& t : prims_.texts) {
      layoutAnchoredText(*atlas_, t.text, t.x, t.y, t.fontPx, t.align, t.color, text);
    }
    if (text.glyphCount > 0) {
      emitItem(result, slot, "textGlyph@1", "glyph12",
               static_cast<std::uint32_t>(text.glyphCount),
               std::move(text.glyphInstances), 0.0f);
    }
  }

  // Layer first: it cascades to the draw items still bound to the geometry.
  result.disposeCommands.insert(result.disposeCommands.begin(),
    R"({"cmd":"delete","id":)" + idStr(layerId()) + "}");

  return result;
}

} // namespace qc
