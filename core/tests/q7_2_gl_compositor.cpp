// Q7.2 — GlCompositor test (OSMesa)
// Full chart through the GL path: pixels, stats and scene teardown.

#include "qc/compose/GlCompositor.hpp"
#include "qc/layout/LayerBuilder.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

#ifndef FONT_PATH
#define FONT_PATH "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"
#endif

// Canvas pixel (top-left origin) from a bottom-up readback.
static const std::uint8_t* pixelAt(const qc::RasterImage& img, int x, int y) {
  const int row = img.bottomUp ? (img.height - 1 - y) : y;
  return img.rgba.data() + (static_cast<std::size_t>(row) * img.width + x) * 4;
}

static bool near(std::uint8_t a, std::uint8_t b) {
  return (a > b ? a - b : b - a) <= 2;
}

static qc::ChartRequest sampleRequest() {
  qc::ChartRequest req;
  req.title = "GL";
  req.ticker = "GLTEST";
  req.timeframe = "1h";
  const std::int64_t t0 = 1700000000000LL;
  const double closes[4] = {150, 140, 160, 145};
  double open = 100;
  for (int i = 0; i < 4; i++) {
    qc::Candle c;
    c.timestamp = t0 + i * 3600000LL;
    c.open = open;
    c.close = closes[i];
    c.low = 90;
    c.high = 170;
    c.volume = 10 + i;
    req.candles.push_back(c);
    req.candleColors.push_back(qc::Rgba{0, 255, 0, 255});
    open = closes[i];
  }
  qc::Marker m;
  m.time = t0 + 3600000LL;
  m.color = qc::Rgba{0, 0, 255, 255};
  m.hasText = true;
  m.text = "S";
  req.plots.marks.push_back(m);
  return req;
}

int main() {
  qc::GlCompositor comp(FONT_PATH);
  const qc::ChartStyle style;
  const qc::ChartRequest req = sampleRequest();

  auto layout = qc::buildChartLayout(req, style);
  requireTrue(layout.ok, "layout");

  qc::RasterImage img;
  auto st = comp.rasterize(layout.layout, img);
  if (!st.ok) {
    requireTrue(st.err.code == qc::ErrorCode::RenderFailed, "RenderFailed when unavailable");
    std::printf("SKIPPED (no OSMesa): %s\n", st.err.message.c_str());
    return 0;
  }

  // ---- Test 1: image shape + page background ----
  {
    requireTrue(img.width == 1280 && img.height == 960, "canvas size");
    requireTrue(img.rgba.size() == 1280u * 960u * 4u, "rgba size");
    requireTrue(img.bottomUp, "GL readback is bottom-up");
    const auto* p = pixelAt(img, 3, 3);
    requireTrue(p[0] == 255 && p[1] == 255 && p[2] == 255, "white corner");
    std::printf("  Test 1 (background): PASS\n");
  }

  // ---- Test 2: candle body color ----
  {
    const auto& bodies = layout.layout.get(qc::RenderLayer::Bodies).rects;
    requireTrue(bodies.size() == 4, "4 bodies");
    // first candle: 100 -> 150, tall enough to sample its middle
    const int cx = static_cast<int>((bodies[0].x0 + bodies[0].x1) * 0.5f);
    const int cy = static_cast<int>((bodies[0].y0 + bodies[0].y1) * 0.5f);
    const auto* p = pixelAt(img, cx, cy);
    requireTrue(near(p[0], 0) && near(p[1], 255) && near(p[2], 0), "green body");
    std::printf("  Test 2 (body pixels): PASS\n");
  }

  // ---- Test 3: stats ----
  {
    const qc::Stats& s = comp.lastStats();
    requireTrue(s.drawCalls > 0, "draw calls");
    requireTrue(s.rects >= 4, "rect instances");
    requireTrue(s.triangles >= 1, "marker triangle");
    requireTrue(s.glyphs > 0, "text drawn");
    requireTrue(s.uploadedBytes > 0, "uploads");
    requireTrue(s.frameMs >= 0.0, "frame time");
    std::printf("  Test 3 (stats): PASS\n");
  }

  // ---- Test 4: per-request resources are torn down ----
  {
    const qc::Scene& scene = comp.scene();
    requireTrue(scene.hasPane(qc::GlCompositor::kPaneId), "pane persists");
    requireTrue(scene.hasTransform(qc::GlCompositor::kTransformId), "transform persists");
    requireTrue(scene.layerIds().empty(), "no layers left");
    requireTrue(scene.drawItemIds().empty(), "no draw items left");
    requireTrue(comp.gpuBuffers().size() == 0, "GPU buffers released");
    requireTrue(comp.gpuBuffers().pooled() > 0, "VBO names kept for reuse");
    std::printf("  Test 4 (teardown): PASS\n");
  }

  // ---- Test 5: second render reuses the context ----
  {
    qc::RasterImage again;
    requireTrue(comp.rasterize(layout.layout, again).ok, "second render");
    requireTrue(again.rgba == img.rgba, "deterministic output");
    std::printf("  Test 5 (repeat render): PASS\n");
  }

  std::printf("Q7.2 gl_compositor: ALL PASS\n");
  return 0;
}
