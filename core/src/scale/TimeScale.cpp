#include "qc/scale/TimeScale.hpp"
#include <algorithm>

namespace qc {

TimeScale::TimeScale(const std::vector<Candle>& candles, float left, float right)
  : left_(left), right_(right) {
  times_.reserve(candles.size());
  for (const auto& c : candles) times_.push_back(c.timestamp);
  band_ = times_.empty() ? 0.0f : (right_ - left_) / static_cast<float>(times_.size());
}

float TimeScale::centerX(std::size_t index) const {
  return left_ + (static_cast<float>(index) + 0.5f) * band_;
}

float TimeScale::bodyWidth() const {
  return band_ * kBodyFraction;
}

float TimeScale::wickWidth() const {
  return std::max(1.0f, bodyWidth() * kWickFraction);
}

bool TimeScale::indexOf(std::int64_t ts, std::size_t& outIndex) const {
  for (std::size_t i = 0; i < times_.size(); i++) {
    if (times_[i] == ts) {
      outIndex = i;
      return true;
    }
  }
  return false;
}

bool TimeScale::mapTime(std::int64_t ts, float& outX) const {
  if (times_.empty()) return false;

  std::size_t exact = 0;
  if (indexOf(ts, exact)) {
    outX = centerX(exact);
    return true;
  }

  // Caller order is canonical; walk neighbouring pairs in that order.
  for (std::size_t i = 0; i + 1 < times_.size(); i++) {
    const std::int64_t a = times_[i];
    const std::int64_t b = times_[i + 1];
    const std::int64_t lo = std::min(a, b);
    const std::int64_t hi = std::max(a, b);
    if (ts < lo || ts > hi || lo == hi) continue;

    // Differences in double: widely spaced int64 stamps overflow otherwise.
    const double span = static_cast<double>(b) - static_cast<double>(a);
    const double t = (span != 0.0) ? (static_cast<double>(ts) - static_cast<double>(a)) / span
                                   : 0.0;
    const float x0 = centerX(i);
    const float x1 = centerX(i + 1);
    outX = x0 + static_cast<float>(t) * (x1 - x0);
    return true;
  }
  return false;
}

float TimeScale::clampTime(std::int64_t ts) const {
  float x = 0.0f;
  if (mapTime(ts, x)) return x;
  if (times_.empty()) return left_;
  const std::int64_t first = std::min(times_.front(), times_.back());
  return (ts < first) ? left_ : right_;
}

} // namespace qc
