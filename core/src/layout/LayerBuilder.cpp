#include "qc/layout/LayerBuilder.hpp"
#include "qc/math/PriceFormat.hpp"
#include "qc/math/TimeFormat.hpp"

#include <algorithm>
#include <cmath>

namespace qc {

namespace {

RectPrim makeRect(float x0, float y0, float x1, float y1, Rgba color) {
  RectPrim r;
  r.x0 = std::min(x0, x1);
  r.x1 = std::max(x0, x1);
  r.y0 = std::min(y0, y1);
  r.y1 = std::max(y0, y1);
  r.color = color;
  return r;
}

LinePrim makeLine(float x0, float y0, float x1, float y1, float width, Rgba color) {
  LinePrim l;
  l.x0 = x0; l.y0 = y0;
  l.x1 = x1; l.y1 = y1;
  l.width = width;
  l.color = color;
  return l;
}

TextPrim makeText(float x, float y, std::string text, float px, TextAlign align, Rgba color) {
  TextPrim t;
  t.x = x;
  t.y = y;
  t.text = std::move(text);
  t.fontPx = px;
  t.align = align;
  t.color = color;
  return t;
}

} // anonymous namespace

LayerBuilder::LayerBuilder(const ChartRequest& request, const ChartScales& scales,
                           const ChartStyle& style)
  : req_(request), sc_(scales), style_(style),
    stats_(computeTableStats(request.candles)) {}

ChartLayout LayerBuilder::build() const {
  ChartLayout layout;
  buildBackground(layout.get(RenderLayer::Background));
  buildGrid(layout.get(RenderLayer::Grid));
  buildZones(layout.get(RenderLayer::Zones));
  buildVLines(layout.get(RenderLayer::VLines));
  buildVolume(layout.get(RenderLayer::Volume));
  buildWicks(layout.get(RenderLayer::Wicks));
  buildBodies(layout.get(RenderLayer::Bodies));
  buildMarkers(layout.get(RenderLayer::Markers));
  buildPriceLine(layout.get(RenderLayer::PriceLine));
  buildTable(layout.get(RenderLayer::Table));
  return layout;
}

void LayerBuilder::buildBackground(LayerPrimitives& out) const {
  const PixelRect& c = sc_.frame.canvas;
  out.rects.push_back(makeRect(c.x0, c.y0, c.x1, c.y1, style_.background));

  const PixelRect& p = sc_.frame.plot;
  const float w = style_.frameWidth;
  out.lines.push_back(makeLine(p.x0, p.y0, p.x1, p.y0, w, style_.frame));
  out.lines.push_back(makeLine(p.x1, p.y0, p.x1, p.y1, w, style_.frame));
  out.lines.push_back(makeLine(p.x1, p.y1, p.x0, p.y1, w, style_.frame));
  out.lines.push_back(makeLine(p.x0, p.y1, p.x0, p.y0, w, style_.frame));
}

void LayerBuilder::buildGrid(LayerPrimitives& out) const {
  const PixelRect& plot = sc_.frame.plot;
  const PixelRect& area = sc_.frame.priceArea;
  const PriceScale& ps = sc_.price;

  // Horizontal lines evenly spaced in log space across the price area.
  const int hCount = std::max(2, style_.horizontalGridLines);
  const int segments = hCount - 1;
  for (int i = 0; i < hCount; i++) {
    const double f = static_cast<double>(i) / static_cast<double>(segments);
    const float y = ps.toY(ps.priceAtFraction(f));
    const Rgba& color = (i % 2 == 0) ? style_.gridEven : style_.gridOdd;
    out.lines.push_back(makeLine(plot.x0, y, plot.x1, y, style_.gridLineWidth, color));
  }

  const int vCount = std::max(2, style_.verticalGridLines);
  for (int i = 0; i < vCount; i++) {
    const float x = plot.x0 + plot.width() * static_cast<float>(i) / static_cast<float>(vCount - 1);
    out.lines.push_back(makeLine(x, plot.y0, x, plot.y1, style_.gridLineWidth, style_.gridVertical));
  }

  // Price labels in the right gutter, evenly spaced in log space.
  const int labels = std::max(1, style_.priceLabelCount);
  for (int i = 0; i < labels; i++) {
    const double f = (static_cast<double>(i) + 0.5) / static_cast<double>(labels);
    const double price = ps.priceAtFraction(f);
    const float y = ps.toY(price);
    if (y < area.y0 || y > area.y1) continue;
    out.texts.push_back(makeText(sc_.frame.priceAxis.x0 + 6.0f, y, formatPriceLabel(price),
                                 style_.priceLabelPx, TextAlign::Left, style_.axisText));
  }

  // Time labels under the plot, on evenly distributed candles.
  const TimeScale& ts = sc_.time;
  const std::size_t n = ts.count();
  const std::size_t tCount = std::min<std::size_t>(n, static_cast<std::size_t>(std::max(1, style_.timeLabelCount)));
  const float labelY = sc_.frame.timeAxis.y0 + 14.0f;
  std::size_t lastIndex = n;
  for (std::size_t k = 0; k < tCount; k++) {
    std::size_t idx = 0;
    if (tCount > 1) {
      idx = static_cast<std::size_t>(std::llround(
          static_cast<double>(k) * static_cast<double>(n - 1) / static_cast<double>(tCount - 1)));
    }
    if (idx == lastIndex) continue;
    lastIndex = idx;
    out.texts.push_back(makeText(ts.centerX(idx), labelY,
                                 formatTimestampMs(ts.timeAt(idx), kAxisTimeFormat),
                                 style_.timeLabelPx, TextAlign::Center, style_.axisText));
  }

  if (!req_.title.empty()) {
    const PixelRect& band = sc_.frame.titleBand;
    out.texts.push_back(makeText(band.centerX(), band.centerY(), req_.title,
                                 style_.titlePx, TextAlign::Center, style_.text));
  }
}

void LayerBuilder::buildZones(LayerPrimitives& out) const {
  const PixelRect& area = sc_.frame.priceArea;
  for (const auto& z : req_.plots.zones) {
    float x0 = sc_.time.clampTime(std::min(z.x1, z.x2));
    float x1 = sc_.time.clampTime(std::max(z.x1, z.x2));
    float y0 = sc_.price.toY(std::max(z.y1, z.y2));
    float y1 = sc_.price.toY(std::min(z.y1, z.y2));

    x0 = std::max(x0, area.x0);
    x1 = std::min(x1, area.x1);
    y0 = std::max(y0, area.y0);
    y1 = std::min(y1, area.y1);
    if (x1 <= x0 || y1 <= y0) continue;

    out.rects.push_back(makeRect(x0, y0, x1, y1, z.color));
  }
}

void LayerBuilder::buildVLines(LayerPrimitives& out) const {
  const PixelRect& plot = sc_.frame.plot;
  for (const auto& v : req_.plots.vlines) {
    float x = 0.0f;
    if (!sc_.time.mapTime(v.time, x)) continue;
    out.lines.push_back(makeLine(x, plot.y0, x, plot.y1, style_.vlineWidth, v.color));
  }
}

void LayerBuilder::buildVolume(LayerPrimitives& out) const {
  const float half = sc_.time.bodyWidth() * 0.5f;
  for (std::size_t i = 0; i < req_.candles.size(); i++) {
    const float h = sc_.volume.height(req_.candles[i].volume);
    if (h <= 0.0f) continue;

    Rgba color = style_.volumeDefault;
    if (i < req_.volumeColors.size()) {
      color = resolveColorOr(req_.volumeColors[i], AlphaPolicy::Opaque, kFallbackGray);
    }
    const float cx = sc_.time.centerX(i);
    out.rects.push_back(makeRect(cx - half, sc_.volume.bottomY() - h,
                                 cx + half, sc_.volume.bottomY(), color));
  }
}

void LayerBuilder::buildWicks(LayerPrimitives& out) const {
  const float half = sc_.time.wickWidth() * 0.5f;
  for (std::size_t i = 0; i < req_.candles.size(); i++) {
    const Candle& c = req_.candles[i];
    const float cx = sc_.time.centerX(i);
    float yHigh = sc_.price.toY(c.high);
    float yLow = sc_.price.toY(c.low);
    if (std::fabs(yLow - yHigh) < 1.0f) {
      const float mid = (yHigh + yLow) * 0.5f;
      yHigh = mid - 0.5f;
      yLow = mid + 0.5f;
    }
    out.rects.push_back(makeRect(cx - half, yHigh, cx + half, yLow, style_.wick));
  }
}

void LayerBuilder::buildBodies(LayerPrimitives& out) const {
  const float half = sc_.time.bodyWidth() * 0.5f;
  for (std::size_t i = 0; i < req_.candles.size(); i++) {
    const Candle& c = req_.candles[i];
    const float cx = sc_.time.centerX(i);
    float top = sc_.price.toY(std::max(c.open, c.close));
    float bottom = sc_.price.toY(std::min(c.open, c.close));
    if (bottom - top < kMinBodyHeight) {
      const float mid = (top + bottom) * 0.5f;
      top = mid - kMinBodyHeight * 0.5f;
      bottom = mid + kMinBodyHeight * 0.5f;
    }
    const Rgba color = (i < req_.candleColors.size()) ? req_.candleColors[i] : kDefaultCandleColor;
    out.rects.push_back(makeRect(cx - half, top, cx + half, bottom, color));
  }
}

void LayerBuilder::buildMarkers(LayerPrimitives& out) const {
  const float areaHeight = sc_.frame.priceArea.height();
  const float bodyWidth = sc_.time.bodyWidth();

  for (const auto& m : req_.plots.marks) {
    std::size_t idx = 0;
    if (!sc_.time.indexOf(m.time, idx)) continue;

    const Candle& c = req_.candles[idx];
    const float size = static_cast<float>(m.size);
    const float offset = static_cast<float>(kMarkerOffsetFraction) * areaHeight * size;
    const float halfW = bodyWidth / 3.0f * size;
    const float halfH = offset * 0.5f;
    const float x = sc_.time.centerX(idx);

    TriPrim t;
    t.color = m.color;
    float labelY = 0.0f;
    if (m.position == MarkerPosition::Above) {
      // Downward-pointing, sitting above the high.
      const float y = sc_.price.toY(c.high) - offset;
      t.x[0] = x;         t.y[0] = y + halfH;
      t.x[1] = x - halfW; t.y[1] = y - halfH;
      t.x[2] = x + halfW; t.y[2] = y - halfH;
      labelY = y - offset * static_cast<float>(kMarkerLabelFactor);
    } else {
      // Upward-pointing, hanging below the low.
      const float y = sc_.price.toY(c.low) + offset;
      t.x[0] = x;         t.y[0] = y - halfH;
      t.x[1] = x - halfW; t.y[1] = y + halfH;
      t.x[2] = x + halfW; t.y[2] = y + halfH;
      labelY = y + offset * static_cast<float>(kMarkerLabelFactor);
    }
    out.tris.push_back(t);

    if (m.hasText && !m.text.empty()) {
      const float px = std::max(12.0f * size, kMinMarkerFontPx);
      out.texts.push_back(makeText(x, labelY, m.text, px, TextAlign::Center, m.color));
    }
  }
}

void LayerBuilder::buildPriceLine(LayerPrimitives& out) const {
  if (req_.candles.empty()) return;

  const PixelRect& plot = sc_.frame.plot;
  const Rgba color = trendColor();
  const float y = sc_.price.toY(stats_.current);
  out.lines.push_back(makeLine(plot.x0, y, plot.x1, y, style_.priceLineWidth, color));

  const PixelRect& gutter = sc_.frame.priceAxis;
  const float half = style_.priceTagHeight * 0.5f;
  out.rects.push_back(makeRect(gutter.x0, y - half, gutter.x1, y + half, color));
  out.texts.push_back(makeText(gutter.centerX(), y, formatPrice(stats_.current),
                               style_.priceTagPx, TextAlign::Center, style_.priceTagText));
}

void LayerBuilder::buildTable(LayerPrimitives& out) const {
  if (req_.candles.empty()) return;

  const PixelRect& band = sc_.frame.tableBand;
  const auto rows = tableRows(stats_);

  // Cells: two columns split at the middle, 5 px padding, rows of equal pitch.
  const float padding = 5.0f;
  const float rowPitch = band.height() / static_cast<float>(rows.size() + 1);
  const float rowSpacing = std::floor(rowPitch * 0.15f);
  const float rowHeight = std::floor(rowPitch) - rowSpacing;
  const float bottomPadding = 6.0f;
  const float mid = band.x0 + std::floor(band.width() * 0.5f);

  for (std::size_t r = 0; r < rows.size(); r++) {
    const float y0 = band.y0 + padding +
                     static_cast<float>(r) * (rowHeight + rowSpacing + bottomPadding);
    const float y1 = y0 + rowHeight;
    const float cy = (y0 + y1) * 0.5f;
    const Rgba textColor = (r == 0) ? trendColor() : style_.text;

    out.rects.push_back(makeRect(band.x0 + padding, y0, mid - padding, y1, style_.tableCell));
    out.rects.push_back(makeRect(mid + padding, y0, band.x1 - padding, y1, style_.tableCell));
    out.texts.push_back(makeText(band.x0 + padding * 4.0f, cy, rows[r].label,
                                 style_.tablePx, TextAlign::Left, textColor));
    out.texts.push_back(makeText(mid + padding * 4.0f, cy, rows[r].value,
                                 style_.tablePx, TextAlign::Left, textColor));
  }
}

LayoutResult buildChartLayout(const ChartRequest& request, const ChartStyle& style) {
  LayoutResult r;
  ScalesResult sr = buildScales(request.candles, computeChartFrame());
  if (!sr.ok) {
    r.ok = false;
    r.err = sr.err;
    return r;
  }
  r.scales = sr.scales;

  LayerBuilder builder(request, r.scales, style);
  r.layout = builder.build();
  r.stats = builder.stats();
  return r;
}

} // namespace qc
