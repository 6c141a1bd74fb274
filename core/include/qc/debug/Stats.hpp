#pragma once
#include <cstdint>

namespace qc {

// Per-render counters, logged after every composited chart.
struct Stats {
  double frameMs = 0.0;

  std::uint32_t drawCalls = 0;
  std::uint32_t skippedLayers = 0;   // layers with no primitives

  std::uint32_t rects = 0;
  std::uint32_t triangles = 0;
  std::uint32_t lines = 0;
  std::uint32_t glyphs = 0;

  std::uint64_t uploadedBytes = 0;
};

} // namespace qc
