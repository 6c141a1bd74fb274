#include "qc/pipeline/ChartPipeline.hpp"
#include "qc/debug/Log.hpp"
#include "qc/export/PngEncoder.hpp"
#include "qc/layout/LayerBuilder.hpp"
#include "qc/math/TimeFormat.hpp"
#include "qc/scale/ChartFrame.hpp"

#include <string>

namespace qc {

namespace {

void logRequestSummary(const ChartRequest& req) {
  logf(LogLevel::Info, "new chart request for %s @ %s [%zu candles]",
       req.ticker.c_str(), req.timeframe.c_str(), req.candles.size());
  if (req.candles.empty()) {
    logf(LogLevel::Info, "  no candle data available");
    return;
  }
  logf(LogLevel::Info, "  %zu candles from %s to %s", req.candles.size(),
       formatTimestampMs(req.candles.front().timestamp, kLogTimeFormat, false).c_str(),
       formatTimestampMs(req.candles.back().timestamp, kLogTimeFormat, false).c_str());
  logf(LogLevel::Info, "  desc: %s", req.desc.c_str());
}

} // namespace

ChartPipeline::ChartPipeline(Rasterizer& rasterizer, const ArtifactWriter& writer,
                             Notifier& notifier, const ChartStyle& style)
  : rasterizer_(rasterizer), writer_(writer), notifier_(notifier), style_(style) {}

PipelineResult ChartPipeline::fail(const ChartRequest* request, const Error& err) const {
  if (request) {
    logf(LogLevel::Error, "chart %s %s failed: [%s] %s",
         request->ticker.c_str(), request->timeframe.c_str(),
         toString(err.code), err.message.c_str());
  } else {
    logf(LogLevel::Error, "chart request rejected: [%s] %s",
         toString(err.code), err.message.c_str());
  }
  PipelineResult r;
  r.ok = false;
  r.err = err;
  return r;
}

PipelineResult ChartPipeline::run(const std::string& envelope) {
  ParseResult parsed = parser_.parseEnvelope(envelope);
  if (!parsed.ok) return fail(nullptr, parsed.err);
  return process(parsed.request);
}

PipelineResult ChartPipeline::process(const ChartRequest& request) {
  logRequestSummary(request);

  LayoutResult layout = buildChartLayout(request, style_);
  if (!layout.ok) return fail(&request, layout.err);

  logf(LogLevel::Info, "  price range %.6g .. %.6g, %zu primitives",
       layout.scales.minPrice, layout.scales.maxPrice, layout.layout.primitiveCount());

  RasterImage image;
  Status st = rasterizer_.rasterize(layout.layout, image);
  if (!st.ok) return fail(&request, st.err);

  const Stats& stats = rasterizer_.lastStats();
  logf(LogLevel::Info, "  rendered in %.1f ms: %u draw calls, %u rects, %u tris, %u lines, %u glyphs, %u empty layers",
       stats.frameMs, stats.drawCalls, stats.rects, stats.triangles,
       stats.lines, stats.glyphs, stats.skippedLayers);

  if (image.width <= 0 || image.height <= 0 ||
      image.rgba.size() < static_cast<std::size_t>(image.width) * image.height * 4) {
    return fail(&request, Error{ErrorCode::RenderFailed, "rasterizer returned no pixels"});
  }
  if (image.width != ChartFrame::kCanvasWidth || image.height != ChartFrame::kCanvasHeight) {
    return fail(&request, Error{ErrorCode::RenderFailed,
                                "rasterizer returned " + std::to_string(image.width) + "x" +
                                std::to_string(image.height) + ", expected " +
                                std::to_string(ChartFrame::kCanvasWidth) + "x" +
                                std::to_string(ChartFrame::kCanvasHeight)});
  }

  PngEncodeOptions opts;
  opts.flipY = image.bottomUp;
  const std::vector<std::uint8_t> png =
      encodePng(image.rgba.data(), image.width, image.height, opts);
  if (png.empty()) {
    return fail(&request, Error{ErrorCode::RenderFailed, "PNG encoding produced no data"});
  }

  ArtifactResult written = writer_.write(request, png);
  if (!written.ok) return fail(&request, written.err);

  logf(LogLevel::Info, "chart saved to %s", written.artifact.path.c_str());

  PipelineResult r;
  r.artifact = written.artifact;
  r.stats = stats;
  r.notified = notifier_.notify(request, written.artifact).ok;
  return r;
}

} // namespace qc
