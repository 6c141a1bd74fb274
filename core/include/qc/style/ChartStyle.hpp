#pragma once
#include "qc/color/Color.hpp"

namespace qc {

// Fixed look of a rendered chart (light page, gray grid).
struct ChartStyle {
  // Page
  Rgba background{255, 255, 255, 255};
  Rgba frame{150, 150, 150, 255};
  float frameWidth{1.0f};

  // Grid
  Rgba gridEven{235, 235, 235, 255};
  Rgba gridOdd{240, 240, 240, 255};
  Rgba gridVertical{245, 245, 245, 255};
  float gridLineWidth{1.0f};
  int horizontalGridLines{17};
  int verticalGridLines{6};
  int priceLabelCount{8};
  int timeLabelCount{8};

  // Text
  Rgba text{0, 0, 0, 255};
  Rgba axisText{60, 60, 60, 255};
  float titlePx{24.0f};
  float priceLabelPx{15.0f};
  float timeLabelPx{12.0f};
  float tablePx{14.0f};
  float priceTagPx{13.0f};

  // Series
  Rgba wick{70, 70, 70, 255};
  Rgba volumeDefault{130, 130, 130, 255};
  Rgba up{0, 150, 0, 255};
  Rgba down{180, 0, 0, 255};

  // Overlays
  float vlineWidth{1.0f};
  float priceLineWidth{1.0f};
  Rgba priceTagText{255, 255, 255, 255};
  float priceTagHeight{20.0f};

  // Statistics table
  Rgba tableCell{220, 220, 220, 255};
};

} // namespace qc
