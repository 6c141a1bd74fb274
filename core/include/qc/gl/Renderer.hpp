#pragma once
#include "qc/debug/Stats.hpp"
#include "qc/gl/GpuBufferManager.hpp"
#include "qc/gl/ShaderProgram.hpp"
#include "qc/scene/Scene.hpp"
#include <glad/gl.h>
#include <string>

namespace qc {

class GlyphAtlas;

// Draws a Scene: panes, then their layers, then each layer's draw items,
// all in ascending id order.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Compile shaders, create VAO. Call once after the GL context is current.
  bool init();
  bool inited() const { return inited_; }
  const std::string& lastError() const { return lastError_; }

  // Glyph atlas for textGlyph@1.
  void setGlyphAtlas(GlyphAtlas* atlas);

  Stats render(const Scene& scene, GpuBufferManager& gpuBufs, int viewW, int viewH);

private:
  ShaderProgram rectProg_;   // colorRect@1
  ShaderProgram triProg_;    // colorTri@1
  ShaderProgram lineProg_;   // lineAA@1
  ShaderProgram glyphProg_;  // textGlyph@1
  GLuint vao_{0};
  GLuint atlasTexture_{0};
  bool inited_{false};
  std::string lastError_;

  GlyphAtlas* atlas_{nullptr};

  void drawRects(const DrawItem& di, const Scene& scene, GpuBufferManager& gpuBufs, Stats& stats);
  void drawTris(const DrawItem& di, const Scene& scene, GpuBufferManager& gpuBufs, Stats& stats);
  void drawLines(const DrawItem& di, const Scene& scene, GpuBufferManager& gpuBufs, Stats& stats);
  void drawGlyphs(const DrawItem& di, const Scene& scene, GpuBufferManager& gpuBufs, Stats& stats);

  void uploadAtlasIfDirty();
};

} // namespace qc
