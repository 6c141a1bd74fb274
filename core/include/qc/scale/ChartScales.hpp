#pragma once
#include "qc/errors/Error.hpp"
#include "qc/request/ChartRequest.hpp"
#include "qc/scale/ChartFrame.hpp"
#include "qc/scale/PriceScale.hpp"
#include "qc/scale/TimeScale.hpp"
#include <vector>

namespace qc {

// Bar height = volume / maxVolume * band height. maxVolume <= 0 gives flat bars.
class VolumeScale {
public:
  VolumeScale() = default;
  VolumeScale(double maxVolume, float yBottom, float bandHeight)
    : maxVolume_(maxVolume), yBottom_(yBottom), bandHeight_(bandHeight) {}

  float height(double volume) const {
    if (maxVolume_ <= 0.0 || volume <= 0.0) return 0.0f;
    double h = volume / maxVolume_ * static_cast<double>(bandHeight_);
    if (h > bandHeight_) h = bandHeight_;
    return static_cast<float>(h);
  }
  float topY(double volume) const { return yBottom_ - height(volume); }
  float bottomY() const { return yBottom_; }
  double maxVolume() const { return maxVolume_; }

private:
  double maxVolume_{0};
  float yBottom_{0};
  float bandHeight_{0};
};

struct ChartScales {
  ChartFrame frame;
  TimeScale time;
  PriceScale price;
  VolumeScale volume;

  double minPrice{0};   // lowest candle price seen (after clamping)
  double maxPrice{0};   // highest candle price seen
  double maxVolume{0};
};

struct ScalesResult {
  bool ok{true};
  Error err{};
  ChartScales scales{};
};

// Derive all scales from the candle set. EmptySeries when there are no candles.
ScalesResult buildScales(const std::vector<Candle>& candles, const ChartFrame& frame);

} // namespace qc
