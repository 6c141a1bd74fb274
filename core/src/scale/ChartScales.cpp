#include "qc/scale/ChartScales.hpp"
#include <algorithm>
#include <limits>

namespace qc {

ScalesResult buildScales(const std::vector<Candle>& candles, const ChartFrame& frame) {
  ScalesResult r;
  if (candles.empty()) {
    r.ok = false;
    r.err.code = ErrorCode::EmptySeries;
    r.err.message = "no candles to draw";
    return r;
  }

  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();
  double maxVol = 0.0;
  for (const auto& c : candles) {
    // low <= open, close <= high is not enforced; bound by all four.
    lo = std::min({lo, c.low, c.open, c.close, c.high});
    hi = std::max({hi, c.high, c.open, c.close, c.low});
    maxVol = std::max(maxVol, c.volume);
  }

  ChartScales& s = r.scales;
  s.frame = frame;
  s.minPrice = lo;
  s.maxPrice = hi;
  s.maxVolume = maxVol;
  s.time = TimeScale(candles, frame.plot.x0, frame.plot.x1);
  s.price = PriceScale(lo, hi, frame.priceArea.y0, frame.priceArea.y1);
  s.volume = VolumeScale(maxVol, frame.volumeBand.y1, frame.volumeBand.height());
  return r;
}

} // namespace qc
