#pragma once

namespace qc {

// Axis-aligned rectangle in canvas pixels (origin top-left, y down).
struct PixelRect {
  float x0{0}, y0{0}, x1{0}, y1{0};

  float width() const { return x1 - x0; }
  float height() const { return y1 - y0; }
  float centerX() const { return (x0 + x1) * 0.5f; }
  float centerY() const { return (y0 + y1) * 0.5f; }
  bool contains(float x, float y) const {
    return x >= x0 && x <= x1 && y >= y0 && y <= y1;
  }
};

// Fixed page geometry of a chart image.
//
//   +--------------------------------------------+  0
//   |                  title                     |
//   +------+----------------------------+--------+  titleHeight
//   |      |     statistics table       |        |
//   +------+----------------------------+--------+  headerHeight
//   |  plot: price area                 | price  |
//   |        ...                        | axis   |
//   |        volume band                |        |
//   +-----------------------------------+--------+
//   |  time axis                                 |
//   +--------------------------------------------+  canvasHeight
struct ChartFrame {
  static constexpr int kCanvasWidth = 1280;
  static constexpr int kCanvasHeight = 960;

  static constexpr float kTitleHeight = 40.0f;
  static constexpr float kTableHeight = 100.0f;
  static constexpr float kTableMarginFraction = 0.15f;  // each side

  static constexpr float kMargin = 10.0f;
  static constexpr float kMarginBottom = 20.0f;
  static constexpr float kPriceAxisWidth = 80.0f;
  static constexpr float kTimeAxisHeight = 40.0f;

  static constexpr float kVolumeBandFraction = 0.15f;  // of the plot height
  static constexpr float kVolumeGap = 6.0f;            // between price area and volume band

  PixelRect canvas;
  PixelRect titleBand;
  PixelRect tableBand;   // already inset by the side margins
  PixelRect plot;        // price area + volume band
  PixelRect priceArea;
  PixelRect volumeBand;
  PixelRect priceAxis;   // right gutter next to the plot
  PixelRect timeAxis;    // below the plot
};

inline ChartFrame computeChartFrame() {
  ChartFrame f;
  const float w = static_cast<float>(ChartFrame::kCanvasWidth);
  const float h = static_cast<float>(ChartFrame::kCanvasHeight);
  const float header = ChartFrame::kTitleHeight + ChartFrame::kTableHeight;

  f.canvas = {0.0f, 0.0f, w, h};
  f.titleBand = {0.0f, 0.0f, w, ChartFrame::kTitleHeight};

  const float side = static_cast<float>(static_cast<int>(w * ChartFrame::kTableMarginFraction));
  f.tableBand = {side, ChartFrame::kTitleHeight, w - side, header};

  f.plot.x0 = ChartFrame::kMargin;
  f.plot.x1 = w - ChartFrame::kMargin - ChartFrame::kPriceAxisWidth;
  f.plot.y0 = header + ChartFrame::kMargin;
  f.plot.y1 = h - ChartFrame::kMarginBottom - ChartFrame::kTimeAxisHeight;

  const float volH = f.plot.height() * ChartFrame::kVolumeBandFraction;
  f.volumeBand = {f.plot.x0, f.plot.y1 - volH, f.plot.x1, f.plot.y1};
  f.priceArea = {f.plot.x0, f.plot.y0, f.plot.x1, f.volumeBand.y0 - ChartFrame::kVolumeGap};

  f.priceAxis = {f.plot.x1, f.plot.y0, f.plot.x1 + ChartFrame::kPriceAxisWidth, f.plot.y1};
  f.timeAxis = {f.plot.x0, f.plot.y1, f.plot.x1, f.plot.y1 + ChartFrame::kTimeAxisHeight};
  return f;
}

} // namespace qc
