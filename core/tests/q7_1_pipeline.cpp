// Q7.1 — ChartPipeline test
// decode -> layout -> rasterize -> PNG -> write -> notify, with an in-memory
// rasterizer so no GL context is needed.

#include "qc/pipeline/ChartPipeline.hpp"
#include "qc/scale/ChartFrame.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Fills the canvas with one color and remembers what it was asked to draw.
class FakeRasterizer : public qc::Rasterizer {
public:
  int calls{0};
  bool failNext{false};
  bool returnNoPixels{false};
  bool wrongSize{false};
  std::size_t lastPrimitiveCount{0};
  std::size_t lastBodies{0};

  qc::Status rasterize(const qc::ChartLayout& layout, qc::RasterImage& out) override {
    calls++;
    if (failNext) {
      failNext = false;
      return qc::Status::fail(qc::ErrorCode::RenderFailed, "fake: no context");
    }
    lastPrimitiveCount = layout.primitiveCount();
    lastBodies = layout.get(qc::RenderLayer::Bodies).rects.size();

    out.width = wrongSize ? 8 : qc::ChartFrame::kCanvasWidth;
    out.height = wrongSize ? 6 : qc::ChartFrame::kCanvasHeight;
    out.bottomUp = true;
    if (returnNoPixels) {
      out.rgba.clear();
    } else {
      out.rgba.assign(static_cast<std::size_t>(out.width) * out.height * 4, 255);
    }
    stats_.drawCalls = 3;
    stats_.rects = static_cast<std::uint32_t>(lastBodies);
    return qc::Status::success();
  }

  const qc::Stats& lastStats() const override { return stats_; }

private:
  qc::Stats stats_{};
};

static const char* kBody = R"({
  "title": "ETH 4h",
  "ticker": "ETHUSD",
  "timeframe": "4h",
  "cols": ["timestamp","open","high","low","close","volume"],
  "data": [[1700000000000,100,110,90,105,10],
           [1700014400000,105,108,95,100,20],
           [1700028800000,100,120,99,118,30]],
  "candle_colors": ["#00FF00","#FF0000","#00FF00"],
  "plots": {"marks":[{"time":1700028800000,"position":"below","color":"#0000FF","text":"B"}]},
  "desc": "three bars",
  "subscriber_list": "premium"
})";

static std::string envelope(const std::string& body) {
  return R"(["chart","request",)" + body + "]";
}

static std::vector<std::uint8_t> readAll(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), {});
}

static std::uint32_t readBe32(const std::vector<std::uint8_t>& b, std::size_t at) {
  return (std::uint32_t(b[at]) << 24) | (std::uint32_t(b[at + 1]) << 16) |
         (std::uint32_t(b[at + 2]) << 8) | std::uint32_t(b[at + 3]);
}

int main() {
  const fs::path dir = fs::temp_directory_path() / "qc_q7_1_pipeline";
  fs::remove_all(dir);
  fs::create_directories(dir);

  FakeRasterizer raster;
  qc::ArtifactWriter writer(dir.string());
  qc::RecordingChannel channel;
  qc::Notifier notifier(channel);
  qc::ChartPipeline pipeline(raster, writer, notifier);

  // ---- Test 1: success writes the PNG and notifies once ----
  {
    auto r = pipeline.run(envelope(kBody));
    requireTrue(r.ok, "pipeline ok");
    requireTrue(r.notified, "notified");
    requireTrue(r.artifact.path == (dir / "ETHUSD_4h.png").string(), "artifact path");
    requireTrue(r.stats.drawCalls == 3, "stats forwarded");
    requireTrue(raster.lastBodies == 3, "one body per candle");
    requireTrue(raster.lastPrimitiveCount > 3, "axes, grid, markers present");

    auto bytes = readAll(r.artifact.path);
    requireTrue(bytes.size() > 8 && bytes[1] == 'P' && bytes[2] == 'N' && bytes[3] == 'G', "PNG on disk");
    requireTrue(bytes.size() > 24 && std::memcmp(&bytes[12], "IHDR", 4) == 0, "IHDR first");
    requireTrue(readBe32(bytes, 16) == 1280 && readBe32(bytes, 20) == 960, "1280x960 IHDR");

    requireTrue(channel.messages().size() == 1, "one notification");
    requireTrue(channel.messages()[0].route == "telegram", "route");
    requireTrue(channel.messages()[0].payload.find("\"subscriber_list\":\"premium\"") != std::string::npos,
                "destination in payload");
    requireTrue(channel.messages()[0].payload.find(r.artifact.path) != std::string::npos, "path in payload");
    std::printf("  Test 1 (success): PASS\n");
  }

  // ---- Test 2: empty series stops before rendering ----
  {
    const std::string empty = R"({"title":"","ticker":"EMPTY","timeframe":"1m","cols":[],
      "data":[],"candle_colors":[],"plots":{"vlines":[{"time":1,"color":"#000000"}]},"desc":""})";

    const int before = raster.calls;
    auto r = pipeline.run(envelope(empty));
    requireTrue(!r.ok && r.err.code == qc::ErrorCode::EmptySeries, "EmptySeries");
    requireTrue(raster.calls == before, "not rasterized");
    requireTrue(!fs::exists(dir / "EMPTY_1m.png"), "no file");
    requireTrue(channel.messages().size() == 1, "no notification");
    std::printf("  Test 2 (empty series): PASS\n");
  }

  // ---- Test 3: malformed and schema failures ----
  {
    auto r = pipeline.run("not json at all");
    requireTrue(!r.ok && r.err.code == qc::ErrorCode::MalformedRequest, "malformed");
    auto s = pipeline.run(envelope(R"({"ticker":"X"})"));
    requireTrue(!s.ok && s.err.code == qc::ErrorCode::SchemaError, "schema");
    requireTrue(channel.messages().size() == 1, "nothing sent");
    std::printf("  Test 3 (rejected requests): PASS\n");
  }

  // ---- Test 4: render failures leave no artifact ----
  {
    fs::remove(dir / "ETHUSD_4h.png");
    raster.failNext = true;
    auto r = pipeline.run(envelope(kBody));
    requireTrue(!r.ok && r.err.code == qc::ErrorCode::RenderFailed, "RenderFailed");
    requireTrue(!fs::exists(dir / "ETHUSD_4h.png"), "no file after render failure");

    raster.returnNoPixels = true;
    auto e = pipeline.run(envelope(kBody));
    raster.returnNoPixels = false;
    requireTrue(!e.ok && e.err.code == qc::ErrorCode::RenderFailed, "no pixels");
    requireTrue(!fs::exists(dir / "ETHUSD_4h.png"), "still no file");

    raster.wrongSize = true;
    auto w = pipeline.run(envelope(kBody));
    raster.wrongSize = false;
    requireTrue(!w.ok && w.err.code == qc::ErrorCode::RenderFailed, "wrong canvas size");
    requireTrue(w.err.message.find("8x6") != std::string::npos, "size in message");
    requireTrue(!fs::exists(dir / "ETHUSD_4h.png"), "no file for a wrong-size raster");
    requireTrue(channel.messages().size() == 1, "still one notification");
    std::printf("  Test 4 (render failure): PASS\n");
  }

  // ---- Test 5: notification failure keeps the artifact ----
  {
    channel.failNextSend();
    auto r = pipeline.run(envelope(kBody));
    requireTrue(r.ok, "still ok");
    requireTrue(!r.notified, "not notified");
    requireTrue(fs::exists(r.artifact.path), "artifact kept");
    std::printf("  Test 5 (notify failure): PASS\n");
  }

  // ---- Test 6: write failure ----
  {
    qc::ArtifactWriter badWriter((dir / "missing").string());
    qc::ChartPipeline p(raster, badWriter, notifier);
    const std::size_t sent = channel.messages().size();
    auto r = p.run(envelope(kBody));
    requireTrue(!r.ok && r.err.code == qc::ErrorCode::IoError, "IoError");
    requireTrue(channel.messages().size() == sent, "no notification without artifact");
    std::printf("  Test 6 (write failure): PASS\n");
  }

  fs::remove_all(dir);
  std::printf("Q7.1 pipeline: ALL PASS\n");
  return 0;
}
