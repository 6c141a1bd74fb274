#pragma once
#include "qc/debug/Stats.hpp"
#include "qc/errors/Error.hpp"
#include "qc/layout/Primitives.hpp"
#include <cstdint>
#include <vector>

namespace qc {

// RGBA8 pixels of a composited chart.
struct RasterImage {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;
  bool bottomUp{false};  // true when row 0 is the bottom row (GL readback)
};

// Draws a ChartLayout, layer by layer in z-order, into a RasterImage.
class Rasterizer {
public:
  virtual ~Rasterizer() = default;

  // RenderFailed when the drawing backend is unavailable or fails.
  virtual Status rasterize(const ChartLayout& layout, RasterImage& out) = 0;

  // Counters of the last successful rasterize().
  virtual const Stats& lastStats() const = 0;
};

} // namespace qc
