// Q3.1 — Price and time label formatting

#include "qc/math/PriceFormat.hpp"
#include "qc/math/TimeFormat.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: thousands grouping ----
  {
    requireTrue(qc::formatWithCommas(0) == "0", "0");
    requireTrue(qc::formatWithCommas(999.4) == "999", "999");
    requireTrue(qc::formatWithCommas(1000) == "1,000", "1,000");
    requireTrue(qc::formatWithCommas(1234567.4) == "1,234,567", "1,234,567");
    requireTrue(qc::formatWithCommas(-98765.6) == "-98,766", "negative");
    requireTrue(qc::formatWithCommas(1e20) == "9,223,372,036,854,775,807", "saturates high");
    requireTrue(qc::formatWithCommas(-1e20) == "-9,223,372,036,854,775,808", "saturates low");
    requireTrue(qc::formatPrice(1e20) == "$9,223,372,036,854,775,807", "huge price");
    std::printf("  Test 1 (commas): PASS\n");
  }

  // ---- Test 2: value display tiers ----
  {
    requireTrue(qc::formatPrice(100.0) == "$100", "100");
    requireTrue(qc::formatPrice(43123.7) == "$43,124", "grouped");
    requireTrue(qc::formatPrice(12.345) == "$12.35" || qc::formatPrice(12.345) == "$12.34", "two decimals");
    requireTrue(qc::formatPrice(1.0) == "$1.00", "1.00");
    requireTrue(qc::formatPrice(0.000123456789) == "$0.000123457", "six significant");
    std::printf("  Test 2 (formatPrice): PASS\n");
  }

  // ---- Test 3: axis labels snap to a step ----
  {
    requireTrue(qc::roundPriceLabel(123456.0) == 123500.0, ">= 100000 -> 500");
    requireTrue(qc::roundPriceLabel(12345.0) == 12300.0, ">= 10000 -> 100");
    requireTrue(qc::roundPriceLabel(1234.0) == 1250.0, ">= 1000 -> 50");
    requireTrue(qc::roundPriceLabel(104.0) == 100.0, "else -> 10");
    requireTrue(qc::formatPriceLabel(43123.0) == "$43,100", "label");
    std::printf("  Test 3 (axis labels): PASS\n");
  }

  // ---- Test 4: percent ----
  {
    requireTrue(qc::formatPercent(100.0 * 10.0 / 110.0) == "9.09%", "9.09%");
    requireTrue(qc::formatPercent(0.0) == "0.00%", "0.00%");
    std::printf("  Test 4 (percent): PASS\n");
  }

  // ---- Test 5: timestamps (UTC) ----
  {
    // 2023-11-14 22:13:20 UTC
    requireTrue(qc::formatTimestampMs(1700000000000LL, qc::kAxisTimeFormat) == "11-14 22:13", "axis");
    requireTrue(qc::formatTimestampMs(1700000000000LL, qc::kLogTimeFormat) == "2023-11-14 22:13:20", "log");
    requireTrue(qc::formatTimestampMs(0, qc::kLogTimeFormat) == "1970-01-01 00:00:00", "epoch");
    requireTrue(qc::formatTimestampMs(-1, qc::kLogTimeFormat) == "1969-12-31 23:59:59", "floored");
    std::printf("  Test 5 (timestamps): PASS\n");
  }

  std::printf("Q3.1 price_format: ALL PASS\n");
  return 0;
}
