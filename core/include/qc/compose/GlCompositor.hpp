#pragma once
#include "qc/commands/CommandProcessor.hpp"
#include "qc/compose/Rasterizer.hpp"
#include "qc/gl/GpuBufferManager.hpp"
#include "qc/gl/OsMesaContext.hpp"
#include "qc/gl/Renderer.hpp"
#include "qc/recipe/Recipe.hpp"
#include "qc/scale/ChartFrame.hpp"
#include "qc/scene/ResourceRegistry.hpp"
#include "qc/scene/Scene.hpp"
#include "qc/text/GlyphAtlas.hpp"
#include <string>

namespace qc {

// Rasterizer backed by OpenGL 3.3 core in an OSMesa off-screen context.
//
// Each rasterize() builds one scene layer per non-empty RenderLayer through
// the command processor, renders the scene, reads the pixels back and tears
// the layers down again. The pane, its pixel->clip transform, the GL context
// and the glyph atlas live as long as the compositor.
//
// Must be used from a single thread: the GL context is bound to it.
class GlCompositor : public Rasterizer {
public:
  static constexpr Id kPaneId = 1;
  static constexpr Id kTransformId = 2;

  explicit GlCompositor(std::string fontPath,
                        int width = ChartFrame::kCanvasWidth,
                        int height = ChartFrame::kCanvasHeight);

  GlCompositor(const GlCompositor&) = delete;
  GlCompositor& operator=(const GlCompositor&) = delete;

  Status rasterize(const ChartLayout& layout, RasterImage& out) override;
  const Stats& lastStats() const override { return stats_; }

  // Scene state between requests (empty apart from pane + transform).
  const Scene& scene() const { return scene_; }
  const GpuBufferManager& gpuBuffers() const { return gpuBufs_; }

private:
  std::string fontPath_;
  int width_;
  int height_;
  bool ready_{false};

  OsMesaContext ctx_;
  GlyphAtlas atlas_;
  Renderer renderer_;
  Scene scene_;
  ResourceRegistry registry_;
  CommandProcessor cmds_;
  GpuBufferManager gpuBufs_;
  Stats stats_{};

  Status ensureReady();
  Status applyCommands(const std::vector<CmdString>& commands, const char* what);
  void teardown(const std::vector<RecipeBuildResult>& built);
};

} // namespace qc
