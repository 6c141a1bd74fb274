#pragma once

namespace qc {

// Logarithmic price -> y mapping:
//   y = yTop + (yBottom - yTop) * (ln hi - ln p) / (ln hi - ln lo)
// Higher prices map to smaller y (canvas y grows downward).
class PriceScale {
public:
  static constexpr double kFlatPadding = 0.01;  // +/-1% when lo == hi
  static constexpr double kMinPrice = 1e-12;

  PriceScale() = default;
  PriceScale(double minPrice, double maxPrice, float yTop, float yBottom);

  float toY(double price) const;
  double fromY(float y) const;

  // Price at a fraction of the log range (0 = bottom, 1 = top).
  double priceAtFraction(double f) const;

  double minPrice() const { return lo_; }
  double maxPrice() const { return hi_; }
  float yTop() const { return yTop_; }
  float yBottom() const { return yBottom_; }
  bool padded() const { return padded_; }

private:
  double lo_{1.0}, hi_{10.0};
  double logLo_{0.0}, logHi_{1.0};
  float yTop_{0}, yBottom_{1};
  bool padded_{false};
};

} // namespace qc
