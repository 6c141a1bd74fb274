#pragma once
#include "qc/errors/Error.hpp"
#include "qc/layout/Primitives.hpp"
#include "qc/layout/TableStats.hpp"
#include "qc/request/ChartRequest.hpp"
#include "qc/scale/ChartScales.hpp"
#include "qc/style/ChartStyle.hpp"

namespace qc {

// Computes the pixel primitives of every RenderLayer from a validated request
// and its scales. Pure: no drawing, no I/O.
class LayerBuilder {
public:
  static constexpr double kMarkerOffsetFraction = 0.02;  // of the price-area height, per size unit
  static constexpr double kMarkerLabelFactor = 1.2;      // label distance, in offsets
  static constexpr float kMinMarkerFontPx = 8.0f;
  static constexpr float kMinBodyHeight = 1.0f;

  LayerBuilder(const ChartRequest& request, const ChartScales& scales,
               const ChartStyle& style);

  ChartLayout build() const;

  void buildBackground(LayerPrimitives& out) const;
  void buildGrid(LayerPrimitives& out) const;
  void buildZones(LayerPrimitives& out) const;
  void buildVLines(LayerPrimitives& out) const;
  void buildVolume(LayerPrimitives& out) const;
  void buildWicks(LayerPrimitives& out) const;
  void buildBodies(LayerPrimitives& out) const;
  void buildMarkers(LayerPrimitives& out) const;
  void buildPriceLine(LayerPrimitives& out) const;
  void buildTable(LayerPrimitives& out) const;

  const TableStats& stats() const { return stats_; }

private:
  const ChartRequest& req_;
  const ChartScales& sc_;
  const ChartStyle& style_;
  TableStats stats_;

  Rgba trendColor() const { return stats_.up ? style_.up : style_.down; }
};

struct LayoutResult {
  bool ok{true};
  Error err{};
  ChartScales scales{};
  ChartLayout layout{};
  TableStats stats{};
};

// Scales + layers for a request. EmptySeries when it carries no candles.
LayoutResult buildChartLayout(const ChartRequest& request, const ChartStyle& style);

} // namespace qc
