#pragma once
#include <string>

namespace qc {

// Round to the nearest integer (saturating at the int64 limits) and group
// thousands: 1234567.4 -> "1,234,567".
std::string formatWithCommas(double value);

// Snap an axis price to a readable step:
// >= 100000 -> 500, >= 10000 -> 100, >= 1000 -> 50, else 10.
double roundPriceLabel(double price);

// Axis label: "$" + comma grouped roundPriceLabel(price).
std::string formatPriceLabel(double price);

// Value display (table, price line):
//   |p| >= 100 -> "$12,345"
//   |p| >= 1   -> "$12.35"
//   otherwise  -> up to six significant digits, "$0.000123457"
std::string formatPrice(double price);

// "9.09%"
std::string formatPercent(double pct);

} // namespace qc
