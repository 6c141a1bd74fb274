#include "qc/pipelines/PipelineCatalog.hpp"

namespace qc {

PipelineCatalog::PipelineCatalog() {
  PipelineSpec rect;
  rect.name = "colorRect";
  rect.requiredVertexFormat = VertexFormat::Rect4Color4;
  rect.instanced = true;
  add(std::move(rect));

  PipelineSpec tri;
  tri.name = "colorTri";
  tri.requiredVertexFormat = VertexFormat::Pos2Color4;
  tri.vertexMultiple = 3;
  add(std::move(tri));

  PipelineSpec line;
  line.name = "lineAA";
  line.requiredVertexFormat = VertexFormat::Rect4Color4;
  line.instanced = true;
  add(std::move(line));

  PipelineSpec text;
  text.name = "textGlyph";
  text.requiredVertexFormat = VertexFormat::Glyph12;
  text.instanced = true;
  add(std::move(text));
}

void PipelineCatalog::add(PipelineSpec spec) {
  std::string key = pipelineKey(spec.name, spec.version);
  specs_.emplace(std::move(key), std::move(spec));
}

const PipelineSpec* PipelineCatalog::find(const std::string& key) const {
  auto it = specs_.find(key);
  return it == specs_.end() ? nullptr : &it->second;
}

} // namespace qc
