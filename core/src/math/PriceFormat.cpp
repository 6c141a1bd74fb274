#include "qc/math/PriceFormat.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace qc {

std::string formatWithCommas(double value) {
  // Saturate at the int64 limits; NaN formats as 0.
  std::int64_t rounded = 0;
  if (value >= 9223372036854775807.0) {
    rounded = std::numeric_limits<std::int64_t>::max();
  } else if (value <= -9223372036854775808.0) {
    rounded = std::numeric_limits<std::int64_t>::min();
  } else if (value == value) {
    rounded = static_cast<std::int64_t>(std::llround(value));
  }
  const bool negative = rounded < 0;
  const std::uint64_t magnitude = negative
      ? std::uint64_t{0} - static_cast<std::uint64_t>(rounded)
      : static_cast<std::uint64_t>(rounded);
  std::string digits = std::to_string(magnitude);

  std::string out;
  out.reserve(digits.size() + digits.size() / 3 + 1);
  const std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); i++) {
    if (i != 0 && (i % 3) == lead) out.push_back(',');
    out.push_back(digits[i]);
  }
  return negative ? "-" + out : out;
}

double roundPriceLabel(double price) {
  double step = 10.0;
  if (price >= 100000.0)     step = 500.0;
  else if (price >= 10000.0) step = 100.0;
  else if (price >= 1000.0)  step = 50.0;
  return std::round(price / step) * step;
}

std::string formatPriceLabel(double price) {
  return "$" + formatWithCommas(roundPriceLabel(price));
}

std::string formatPrice(double price) {
  const double mag = std::fabs(price);
  if (mag >= 100.0) return "$" + formatWithCommas(price);

  char buf[64];
  if (mag >= 1.0) {
    std::snprintf(buf, sizeof(buf), "%.2f", price);
  } else {
    std::snprintf(buf, sizeof(buf), "%.6g", price);
  }
  return std::string("$") + buf;
}

std::string formatPercent(double pct) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f%%", pct);
  return buf;
}

} // namespace qc
