#pragma once
#include "qc/ids/Id.hpp"
#include <string>

namespace qc {

enum class ResourceKind : std::uint8_t {
  Pane,
  Layer,
  DrawItem,
  Buffer,
  Geometry,
  Transform
};

inline const char* toString(ResourceKind k) {
  switch (k) {
    case ResourceKind::Pane: return "pane";
    case ResourceKind::Layer: return "layer";
    case ResourceKind::DrawItem: return "drawItem";
    case ResourceKind::Buffer: return "buffer";
    case ResourceKind::Geometry: return "geometry";
    case ResourceKind::Transform: return "transform";
    default: return "unknown";
  }
}

struct Pane {
  Id id{0};
  std::string name;
  bool hasClearColor{false};
  float clearColor[4] = {1.0f, 1.0f, 1.0f, 1.0f};
};

// Layers of a pane are drawn in ascending id order.
struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  // bindings for pipeline execution
  std::string pipeline;  // e.g. "colorRect@1"
  Id geometryId{0};      // must refer to a Geometry resource
  Id transformId{0};     // 0 = identity

  float color[4] = {0.0f, 0.0f, 0.0f, 1.0f};  // textGlyph@1 fallback tint
  float lineWidth{1.0f};                      // lineAA@1, in pixels
};

// Column-major 3x3 affine matrix applied to vertex positions.
struct Transform {
  Id id{0};
  float mat3[9] = {1, 0, 0, 0, 1, 0, 0, 0, 1};
};

} // namespace qc
