#include "qc/compose/GlCompositor.hpp"
#include "qc/debug/Log.hpp"
#include "qc/recipe/LayerRecipe.hpp"
#include <chrono>
#include <cstdio>
#include <utility>

namespace qc {

GlCompositor::GlCompositor(std::string fontPath, int width, int height)
  : fontPath_(std::move(fontPath)), width_(width), height_(height),
    cmds_(scene_, registry_) {}

Status GlCompositor::applyCommands(const std::vector<CmdString>& commands,
                                   const char* what) {
  for (const auto& c : commands) {
    CmdResult r = cmds_.applyJsonText(c);
    if (!r.ok) {
      return Status::fail(ErrorCode::RenderFailed,
                          std::string(what) + ": " + r.err.code + " " +
                          r.err.message + " " + r.err.details);
    }
  }
  return Status::success();
}

Status GlCompositor::ensureReady() {
  if (ready_) {
    if (!ctx_.makeCurrent()) {
      return Status::fail(ErrorCode::RenderFailed, "OSMesa: " + ctx_.lastError());
    }
    return Status::success();
  }

  if (!ctx_.init(width_, height_)) {
    return Status::fail(ErrorCode::RenderFailed, "OSMesa context unavailable: " + ctx_.lastError());
  }
  if (!atlas_.loadFontFile(fontPath_)) {
    return Status::fail(ErrorCode::RenderFailed, "font not loadable: " + fontPath_);
  }
  atlas_.ensureAscii();

  if (!renderer_.init()) {
    return Status::fail(ErrorCode::RenderFailed, "shader build failed: " + renderer_.lastError());
  }
  renderer_.setGlyphAtlas(&atlas_);

  // Canvas pixels (origin top-left, y down) -> clip space.
  char transformCmd[192];
  std::snprintf(transformCmd, sizeof(transformCmd),
    R"({"cmd":"setTransform","id":%llu,"sx":%.9g,"sy":%.9g,"tx":-1,"ty":1})",
    static_cast<unsigned long long>(kTransformId),
    2.0 / static_cast<double>(width_), -2.0 / static_cast<double>(height_));

  const std::vector<CmdString> setup = {
    R"({"cmd":"createPane","id":1,"name":"chart","clearColor":[1,1,1,1]})",
    R"({"cmd":"createTransform","id":2})",
    transformCmd
  };
  Status st = applyCommands(setup, "scene setup");
  if (!st.ok) return st;

  ready_ = true;
  logf(LogLevel::Init, "GL compositor ready (%dx%d, font %s)",
       width_, height_, fontPath_.c_str());
  return Status::success();
}

void GlCompositor::teardown(const std::vector<RecipeBuildResult>& built) {
  for (const auto& b : built) {
    for (const auto& c : b.disposeCommands) {
      CmdResult r = cmds_.applyJsonText(c);
      if (!r.ok) {
        logf(LogLevel::Warn, "dispose failed: %s %s", r.err.code.c_str(), c.c_str());
      }
    }
    for (const auto& buf : b.buffers) {
      gpuBufs_.release(buf.bufferId);
    }
  }
}

Status GlCompositor::rasterize(const ChartLayout& layout, RasterImage& out) {
  const auto t0 = std::chrono::steady_clock::now();

  Status st = ensureReady();
  if (!st.ok) return st;

  Stats stats{};

  // Glyphs first: text layout needs their metrics.
  for (const auto& lp : layout.layers) {
    for (const auto& t : lp.texts) atlas_.ensureText(t.text);
  }

  std::vector<RecipeBuildResult> built;
  built.reserve(kRenderLayerCount);

  for (RenderLayer rl : kRenderOrder) {
    const LayerPrimitives& prims = layout.get(rl);
    if (prims.empty()) {
      stats.skippedLayers++;
      continue;
    }

    LayerRecipeConfig cfg;
    cfg.paneId = kPaneId;
    cfg.transformId = kTransformId;
    cfg.name = toString(rl);
    LayerRecipe recipe(LayerRecipe::idBaseFor(rl), cfg, prims, &atlas_);

    built.push_back(recipe.build());
    const RecipeBuildResult& r = built.back();

    st = applyCommands(r.createCommands, toString(rl));
    if (!st.ok) {
      teardown(built);
      return st;
    }
    for (const auto& buf : r.buffers) {
      gpuBufs_.stage(buf.bufferId, buf.data);
    }
  }

  stats.uploadedBytes = gpuBufs_.uploadDirty();
  Stats drawn = renderer_.render(scene_, gpuBufs_, width_, height_);
  ctx_.finish();

  const bool read = ctx_.readPixels(out.rgba);
  teardown(built);
  if (!read) return Status::fail(ErrorCode::RenderFailed, "glReadPixels failed");

  out.width = width_;
  out.height = height_;
  out.bottomUp = true;

  drawn.skippedLayers = stats.skippedLayers;
  drawn.uploadedBytes = stats.uploadedBytes;
  drawn.frameMs = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - t0).count();
  stats_ = drawn;
  return Status::success();
}

} // namespace qc
