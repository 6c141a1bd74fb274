#pragma once
#include "qc/ids/Id.hpp"
#include <cstdint>
#include <string>

namespace qc {

enum class VertexFormat : std::uint8_t {
  Pos2Color4 = 1,  // per vertex:   x, y, r, g, b, a
  Rect4Color4,     // per instance: x0, y0, x1, y1, r, g, b, a
  Glyph12          // per instance: x0, y0, x1, y1, u0, v0, u1, v1, r, g, b, a
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2Color4: return "pos2_color4";
    case VertexFormat::Rect4Color4: return "rect4_color4";
    case VertexFormat::Glyph12: return "glyph12";
    default: return "unknown";
  }
}

inline bool parseVertexFormat(const std::string& s, VertexFormat& out) {
  if (s == "pos2_color4")  { out = VertexFormat::Pos2Color4;  return true; }
  if (s == "rect4_color4") { out = VertexFormat::Rect4Color4; return true; }
  if (s == "glyph12")      { out = VertexFormat::Glyph12;     return true; }
  return false;
}

// Bytes per vertex (or per instance for instanced formats).
inline std::uint32_t strideOf(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2Color4: return 6 * sizeof(float);
    case VertexFormat::Rect4Color4: return 8 * sizeof(float);
    case VertexFormat::Glyph12: return 12 * sizeof(float);
    default: return 0;
  }
}

inline std::uint32_t floatsOf(VertexFormat f) {
  return strideOf(f) / static_cast<std::uint32_t>(sizeof(float));
}

struct Buffer {
  Id id{0};
  std::uint32_t byteLength{0};
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2Color4};
  std::uint32_t vertexCount{0};  // vertices, or instances for instanced formats
};

} // namespace qc
