#pragma once
#include "qc/color/Color.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

// Back-to-front drawing order. The numeric value is the z-order.
enum class RenderLayer : std::uint8_t {
  Background = 0,
  Grid,
  Zones,
  VLines,
  Volume,
  Wicks,
  Bodies,
  Markers,
  PriceLine,
  Table
};

inline constexpr std::size_t kRenderLayerCount = 10;

inline constexpr RenderLayer kRenderOrder[kRenderLayerCount] = {
  RenderLayer::Background, RenderLayer::Grid,   RenderLayer::Zones,
  RenderLayer::VLines,     RenderLayer::Volume, RenderLayer::Wicks,
  RenderLayer::Bodies,     RenderLayer::Markers, RenderLayer::PriceLine,
  RenderLayer::Table
};

inline const char* toString(RenderLayer l) {
  switch (l) {
    case RenderLayer::Background: return "background";
    case RenderLayer::Grid:       return "grid";
    case RenderLayer::Zones:      return "zones";
    case RenderLayer::VLines:     return "vlines";
    case RenderLayer::Volume:     return "volume";
    case RenderLayer::Wicks:      return "wicks";
    case RenderLayer::Bodies:     return "bodies";
    case RenderLayer::Markers:    return "markers";
    case RenderLayer::PriceLine:  return "priceLine";
    case RenderLayer::Table:      return "table";
    default: return "unknown";
  }
}

// All primitives are in canvas pixels, origin top-left, y down.

struct RectPrim {
  float x0{0}, y0{0}, x1{0}, y1{0};
  Rgba color{};
};

struct TriPrim {
  float x[3] = {0, 0, 0};
  float y[3] = {0, 0, 0};
  Rgba color{};
};

struct LinePrim {
  float x0{0}, y0{0}, x1{0}, y1{0};
  float width{1.0f};
  Rgba color{};
};

enum class TextAlign : std::uint8_t { Left, Center, Right };

// (x, y) is the anchor: horizontal per align, vertical centre of the line.
struct TextPrim {
  float x{0}, y{0};
  std::string text;
  float fontPx{12.0f};
  TextAlign align{TextAlign::Left};
  Rgba color{};
};

struct LayerPrimitives {
  RenderLayer layer{RenderLayer::Background};
  std::vector<RectPrim> rects;
  std::vector<TriPrim> tris;
  std::vector<LinePrim> lines;
  std::vector<TextPrim> texts;

  std::size_t count() const {
    return rects.size() + tris.size() + lines.size() + texts.size();
  }
  bool empty() const { return count() == 0; }
};

// One entry per RenderLayer, stored in z-order.
struct ChartLayout {
  LayerPrimitives layers[kRenderLayerCount];

  ChartLayout() {
    for (std::size_t i = 0; i < kRenderLayerCount; i++) layers[i].layer = kRenderOrder[i];
  }

  LayerPrimitives& get(RenderLayer l) { return layers[static_cast<std::size_t>(l)]; }
  const LayerPrimitives& get(RenderLayer l) const { return layers[static_cast<std::size_t>(l)]; }

  std::size_t primitiveCount() const {
    std::size_t n = 0;
    for (const auto& l : layers) n += l.count();
    return n;
  }
};

} // namespace qc
