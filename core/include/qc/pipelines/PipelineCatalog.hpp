#pragma once
#include "qc/scene/Geometry.hpp"
#include <string>
#include <unordered_map>

namespace qc {

struct PipelineSpec {
  std::string name;   // "colorRect"
  int version{1};
  VertexFormat requiredVertexFormat{VertexFormat::Pos2Color4};
  bool instanced{false};           // vertexCount counts instances
  std::uint32_t vertexMultiple{1}; // non-instanced: vertexCount % vertexMultiple == 0
};

inline std::string pipelineKey(const std::string& name, int version) {
  return name + "@" + std::to_string(version);
}

// Pipelines the renderer knows how to draw:
//   colorRect@1  rect4_color4  instanced filled rectangles
//   colorTri@1   pos2_color4   triangle list, color per vertex
//   lineAA@1     rect4_color4  instanced anti-aliased segments, width per draw item
//   textGlyph@1  glyph12       instanced atlas quads
class PipelineCatalog {
public:
  PipelineCatalog();

  const PipelineSpec* find(const std::string& key) const;

private:
  std::unordered_map<std::string, PipelineSpec> specs_;

  void add(PipelineSpec spec);
};

} // namespace qc
