#pragma once
#include "qc/request/ChartRequest.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace qc {

// Index -> x mapping with one uniform band per candle.
// Candle i is centred at left + (i + 0.5) * band.
class TimeScale {
public:
  static constexpr float kBodyFraction = 0.80f;  // of the band
  static constexpr float kWickFraction = 0.15f;  // of the body

  TimeScale() = default;
  TimeScale(const std::vector<Candle>& candles, float left, float right);

  std::size_t count() const { return times_.size(); }
  float left() const { return left_; }
  float right() const { return right_; }
  float band() const { return band_; }

  float centerX(std::size_t index) const;
  float bodyWidth() const;
  float wickWidth() const;  // never below 1 px

  std::int64_t timeAt(std::size_t index) const { return times_[index]; }

  // First candle whose timestamp equals ts exactly.
  bool indexOf(std::int64_t ts, std::size_t& outIndex) const;

  // Continuous mapping for zones and vlines: timestamps between two
  // neighbouring candles are interpolated between their centres.
  // Returns false outside [first, last].
  bool mapTime(std::int64_t ts, float& outX) const;

  // mapTime, but timestamps before the first / after the last candle
  // are pinned to the left / right plot edge.
  float clampTime(std::int64_t ts) const;

private:
  std::vector<std::int64_t> times_;
  float left_{0};
  float right_{0};
  float band_{0};
};

} // namespace qc
