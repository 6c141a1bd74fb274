#include "qc/gl/Renderer.hpp"
#include "qc/scene/Geometry.hpp"
#include "qc/text/GlyphAtlas.hpp"
#include <cstdio>

namespace qc {

static const float kIdentityMat3[9] = {1,0,0, 0,1,0, 0,0,1};

static const float* resolveTransform(const DrawItem& di, const Scene& scene) {
  if (!di.transformId) return kIdentityMat3;
  const Transform* t = scene.getTransform(di.transformId);
  return t ? t->mat3 : kIdentityMat3;
}

// Two triangles over the unit square, indexed by gl_VertexID % 6.
#define QC_GLSL_QUAD_CORNER                                   \
  "vec2 quadCorner(int v) {\n"                                \
  "    if (v == 0) return vec2(0.0, 0.0);\n"                  \
  "    if (v == 1) return vec2(1.0, 0.0);\n"                  \
  "    if (v == 2) return vec2(0.0, 1.0);\n"                  \
  "    if (v == 3) return vec2(0.0, 1.0);\n"                  \
  "    if (v == 4) return vec2(1.0, 0.0);\n"                  \
  "    return vec2(1.0, 1.0);\n"                              \
  "}\n"

// ---- colorRect@1 ----

static const char* kRectVert =
  "#version 330 core\n"
  "in vec4 a_rect;\n"
  "in vec4 a_color;\n"
  "uniform mat3 u_transform;\n"
  "out vec4 v_color;\n"
  QC_GLSL_QUAD_CORNER
  "void main() {\n"
  "    vec2 uv = quadCorner(gl_VertexID % 6);\n"
  "    vec2 pos = mix(a_rect.xy, a_rect.zw, uv);\n"
  "    vec3 p = u_transform * vec3(pos, 1.0);\n"
  "    gl_Position = vec4(p.xy, 0.0, 1.0);\n"
  "    v_color = a_color;\n"
  "}\n";

static const char* kColorFrag = R"GLSL(
#version 330 core
in vec4 v_color;
out vec4 outColor;
void main() {
    outColor = v_color;
}
)GLSL";

// ---- colorTri@1 ----

static const char* kTriVert = R"GLSL(
#version 330 core
in vec2 a_pos;
in vec4 a_color;
uniform mat3 u_transform;
out vec4 v_color;
void main() {
    vec3 p = u_transform * vec3(a_pos, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
    v_color = a_color;
}
)GLSL";

// ---- lineAA@1 ----
// Segments are expanded in pixel space before the transform so the
// width stays isotropic on a non-square canvas.

static const char* kLineVert =
  "#version 330 core\n"
  "in vec4 a_line;\n"
  "in vec4 a_color;\n"
  "uniform mat3 u_transform;\n"
  "uniform float u_lineWidth;\n"
  "uniform float u_aaWidth;\n"
  "out float v_dist;\n"
  "out vec4 v_color;\n"
  QC_GLSL_QUAD_CORNER
  "void main() {\n"
  "    vec2 p0 = a_line.xy;\n"
  "    vec2 p1 = a_line.zw;\n"
  "    vec2 dir = p1 - p0;\n"
  "    float len = length(dir);\n"
  "    vec2 d = (len > 0.0001) ? dir / len : vec2(1.0, 0.0);\n"
  "    vec2 perp = vec2(-d.y, d.x);\n"
  "    float hw = u_lineWidth * 0.5;\n"
  "    float totalHW = hw + u_aaWidth;\n"
  "    vec2 uv = quadCorner(gl_VertexID % 6);\n"
  "    float side = uv.y * 2.0 - 1.0;\n"
  "    vec2 pos = mix(p0, p1, uv.x) + perp * (side * totalHW);\n"
  "    vec3 p = u_transform * vec3(pos, 1.0);\n"
  "    gl_Position = vec4(p.xy, 0.0, 1.0);\n"
  "    v_dist = side * totalHW / max(hw, 0.0001);\n"
  "    v_color = a_color;\n"
  "}\n";

static const char* kLineFrag = R"GLSL(
#version 330 core
uniform float u_fringeEdge;
in float v_dist;
in vec4 v_color;
out vec4 outColor;
void main() {
    // |d| <= 1: inside the nominal width; 1 -> u_fringeEdge fades out.
    float a = 1.0 - smoothstep(1.0, u_fringeEdge, abs(v_dist));
    outColor = vec4(v_color.rgb, v_color.a * a);
}
)GLSL";

// ---- textGlyph@1 ----

static const char* kGlyphVert =
  "#version 330 core\n"
  "in vec4 a_g0;\n"
  "in vec4 a_g1;\n"
  "in vec4 a_color;\n"
  "uniform mat3 u_transform;\n"
  "out vec2 v_uv;\n"
  "out vec4 v_color;\n"
  QC_GLSL_QUAD_CORNER
  "void main() {\n"
  "    vec2 uv = quadCorner(gl_VertexID % 6);\n"
  "    vec2 pos = mix(a_g0.xy, a_g0.zw, uv);\n"
  "    v_uv = mix(a_g1.xy, a_g1.zw, uv);\n"
  "    vec3 p = u_transform * vec3(pos, 1.0);\n"
  "    gl_Position = vec4(p.xy, 0.0, 1.0);\n"
  "    v_color = a_color;\n"
  "}\n";

static const char* kGlyphFrag = R"GLSL(
#version 330 core
uniform sampler2D u_atlas;
uniform float u_sdf;
in vec2 v_uv;
in vec4 v_color;
out vec4 outColor;
void main() {
    float val = texture(u_atlas, v_uv).r;
    // u_sdf < 0.5: raw coverage atlas
    float a = (u_sdf < 0.5) ? val : smoothstep(0.44, 0.56, val);
    outColor = vec4(v_color.rgb, v_color.a * a);
}
)GLSL";

#undef QC_GLSL_QUAD_CORNER

// ---- Renderer implementation ----

Renderer::~Renderer() {
  if (vao_) {
    glDeleteVertexArrays(1, &vao_);
  }
  if (atlasTexture_) {
    glDeleteTextures(1, &atlasTexture_);
  }
}

void Renderer::setGlyphAtlas(GlyphAtlas* atlas) {
  atlas_ = atlas;
}

bool Renderer::init() {
  if (inited_) return true;

  struct Build {
    ShaderProgram* prog;
    const char* pipeline;
    const char* vert;
    const char* frag;
  };
  const Build builds[] = {
    {&rectProg_,  "colorRect@1", kRectVert,  kColorFrag},
    {&triProg_,   "colorTri@1",  kTriVert,   kColorFrag},
    {&lineProg_,  "lineAA@1",    kLineVert,  kLineFrag},
    {&glyphProg_, "textGlyph@1", kGlyphVert, kGlyphFrag},
  };
  for (const Build& b : builds) {
    if (!b.prog->build(b.pipeline, b.vert, b.frag)) {
      lastError_ = b.prog->lastError();
      return false;
    }
  }

  glGenVertexArrays(1, &vao_);
  glGenTextures(1, &atlasTexture_);
  inited_ = true;
  return true;
}

// Bind `components` floats at byte `offset` of an interleaved instance (or vertex) record.
static void bindAttrib(const ShaderProgram& prog, const char* name, GLint components,
                       GLsizei stride, std::size_t offset, bool perInstance) {
  GLint loc = prog.attribLocation(name);
  if (loc < 0) return;
  glEnableVertexAttribArray(static_cast<GLuint>(loc));
  glVertexAttribPointer(static_cast<GLuint>(loc), components, GL_FLOAT, GL_FALSE,
                        stride, reinterpret_cast<const void*>(offset));
  glVertexAttribDivisor(static_cast<GLuint>(loc), perInstance ? 1 : 0);
}

static void unbindAttrib(const ShaderProgram& prog, const char* name) {
  GLint loc = prog.attribLocation(name);
  if (loc < 0) return;
  glVertexAttribDivisor(static_cast<GLuint>(loc), 0);
  glDisableVertexAttribArray(static_cast<GLuint>(loc));
}

void Renderer::drawRects(const DrawItem& di, const Scene& scene,
                         GpuBufferManager& gpuBufs, Stats& stats) {
  const Geometry* geo = scene.getGeometry(di.geometryId);
  if (!geo || geo->vertexCount == 0) return;
  GLuint vbo = gpuBufs.glBuffer(geo->vertexBufferId);
  if (!vbo) return;

  rectProg_.use();
  rectProg_.setUniformMat3("u_transform", resolveTransform(di, scene));

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Rect4Color4));
  bindAttrib(rectProg_, "a_rect", 4, stride, 0, true);
  bindAttrib(rectProg_, "a_color", 4, stride, 16, true);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo->vertexCount));
  stats.drawCalls++;
  stats.rects += geo->vertexCount;

  unbindAttrib(rectProg_, "a_rect");
  unbindAttrib(rectProg_, "a_color");
}

void Renderer::drawTris(const DrawItem& di, const Scene& scene,
                        GpuBufferManager& gpuBufs, Stats& stats) {
  const Geometry* geo = scene.getGeometry(di.geometryId);
  if (!geo || geo->vertexCount == 0) return;
  GLuint vbo = gpuBufs.glBuffer(geo->vertexBufferId);
  if (!vbo) return;

  triProg_.use();
  triProg_.setUniformMat3("u_transform", resolveTransform(di, scene));

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Pos2Color4));
  bindAttrib(triProg_, "a_pos", 2, stride, 0, false);
  bindAttrib(triProg_, "a_color", 4, stride, 8, false);

  glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(geo->vertexCount));
  stats.drawCalls++;
  stats.triangles += geo->vertexCount / 3;

  unbindAttrib(triProg_, "a_pos");
  unbindAttrib(triProg_, "a_color");
}

void Renderer::drawLines(const DrawItem& di, const Scene& scene,
                         GpuBufferManager& gpuBufs, Stats& stats) {
  const Geometry* geo = scene.getGeometry(di.geometryId);
  if (!geo || geo->vertexCount == 0) return;
  GLuint vbo = gpuBufs.glBuffer(geo->vertexBufferId);
  if (!vbo) return;

  lineProg_.use();
  lineProg_.setUniformMat3("u_transform", resolveTransform(di, scene));

  // AA fringe: 1 pixel beyond the nominal edge.
  const float aaWidth = 1.0f;
  const float hw = di.lineWidth * 0.5f;
  lineProg_.setUniformFloat("u_lineWidth", di.lineWidth);
  lineProg_.setUniformFloat("u_aaWidth", aaWidth);
  lineProg_.setUniformFloat("u_fringeEdge", (hw > 0.0001f) ? ((hw + aaWidth) / hw) : 2.0f);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Rect4Color4));
  bindAttrib(lineProg_, "a_line", 4, stride, 0, true);
  bindAttrib(lineProg_, "a_color", 4, stride, 16, true);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo->vertexCount));
  stats.drawCalls++;
  stats.lines += geo->vertexCount;

  unbindAttrib(lineProg_, "a_line");
  unbindAttrib(lineProg_, "a_color");
}

void Renderer::uploadAtlasIfDirty() {
  if (!atlas_ || !atlas_->isDirty()) return;

  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  GLsizei sz = static_cast<GLsizei>(atlas_->atlasSize());
  glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, sz, sz, 0,
               GL_RED, GL_UNSIGNED_BYTE, atlas_->atlasData());
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);
  atlas_->clearDirty();
}

void Renderer::drawGlyphs(const DrawItem& di, const Scene& scene,
                          GpuBufferManager& gpuBufs, Stats& stats) {
  if (!atlas_) return;
  const Geometry* geo = scene.getGeometry(di.geometryId);
  if (!geo || geo->vertexCount == 0) return;
  GLuint vbo = gpuBufs.glBuffer(geo->vertexBufferId);
  if (!vbo) return;

  glyphProg_.use();
  glyphProg_.setUniformMat3("u_transform", resolveTransform(di, scene));
  glyphProg_.setUniformFloat("u_sdf", atlas_->useSdf() ? 1.0f : 0.0f);

  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  glyphProg_.setUniformInt("u_atlas", 0);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  const GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Glyph12));
  bindAttrib(glyphProg_, "a_g0", 4, stride, 0, true);
  bindAttrib(glyphProg_, "a_g1", 4, stride, 16, true);
  bindAttrib(glyphProg_, "a_color", 4, stride, 32, true);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo->vertexCount));
  stats.drawCalls++;
  stats.glyphs += geo->vertexCount;

  unbindAttrib(glyphProg_, "a_g0");
  unbindAttrib(glyphProg_, "a_g1");
  unbindAttrib(glyphProg_, "a_color");
  glBindTexture(GL_TEXTURE_2D, 0);
}

Stats Renderer::render(const Scene& scene, GpuBufferManager& gpuBufs,
                       int viewW, int viewH) {
  Stats stats{};
  if (!inited_) return stats;

  uploadAtlasIfDirty();

  glViewport(0, 0, viewW, viewH);
  glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  glBindVertexArray(vao_);

  const auto layerIds = scene.layerIds();
  const auto drawItemIds = scene.drawItemIds();

  for (Id paneId : scene.paneIds()) {
    const Pane* pane = scene.getPane(paneId);
    if (!pane) continue;

    if (pane->hasClearColor) {
      glClearColor(pane->clearColor[0], pane->clearColor[1],
                   pane->clearColor[2], pane->clearColor[3]);
      glClear(GL_COLOR_BUFFER_BIT);
    }

    for (Id layerId : layerIds) {
      const Layer* layer = scene.getLayer(layerId);
      if (!layer || layer->paneId != paneId) continue;

      for (Id diId : drawItemIds) {
        const DrawItem* di = scene.getDrawItem(diId);
        if (!di || di->layerId != layerId) continue;
        if (di->pipeline.empty()) continue;

        if (di->pipeline == "colorRect@1") {
          drawRects(*di, scene, gpuBufs, stats);
        } else if (di->pipeline == "colorTri@1") {
          drawTris(*di, scene, gpuBufs, stats);
        } else if (di->pipeline == "lineAA@1") {
          drawLines(*di, scene, gpuBufs, stats);
        } else if (di->pipeline == "textGlyph@1") {
          drawGlyphs(*di, scene, gpuBufs, stats);
        }
      }
    }
  }

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  glDisable(GL_BLEND);
  glFlush();
  return stats;
}

} // namespace qc
