#include "qc/scale/PriceScale.hpp"
#include <algorithm>
#include <cmath>

namespace qc {

PriceScale::PriceScale(double minPrice, double maxPrice, float yTop, float yBottom)
  : yTop_(yTop), yBottom_(yBottom) {
  lo_ = std::max(minPrice, kMinPrice);
  hi_ = std::max(maxPrice, kMinPrice);
  if (hi_ < lo_) std::swap(lo_, hi_);

  if (!(hi_ > lo_)) {
    const double mid = lo_;
    lo_ = std::max(mid * (1.0 - kFlatPadding), kMinPrice);
    hi_ = mid * (1.0 + kFlatPadding);
    padded_ = true;
  }

  logLo_ = std::log(lo_);
  logHi_ = std::log(hi_);
}

float PriceScale::toY(double price) const {
  const double lp = std::log(std::max(price, kMinPrice));
  const double t = (logHi_ - lp) / (logHi_ - logLo_);
  return yTop_ + static_cast<float>(t * static_cast<double>(yBottom_ - yTop_));
}

double PriceScale::fromY(float y) const {
  const double t = static_cast<double>(y - yTop_) / static_cast<double>(yBottom_ - yTop_);
  return std::exp(logHi_ - t * (logHi_ - logLo_));
}

double PriceScale::priceAtFraction(double f) const {
  return std::exp(logLo_ + f * (logHi_ - logLo_));
}

} // namespace qc
