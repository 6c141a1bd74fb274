#include "qc/layout/TableStats.hpp"
#include "qc/math/PriceFormat.hpp"
#include <limits>

namespace qc {

TableStats computeTableStats(const std::vector<Candle>& candles) {
  TableStats s;
  if (candles.empty()) return s;

  const Candle& last = candles.back();
  s.current = last.close;
  s.up = (candles.size() >= 2) ? (last.close >= candles[candles.size() - 2].close)
                               : (last.close >= last.open);

  double high = std::numeric_limits<double>::lowest();
  for (const auto& c : candles) {
    if (c.high > high) high = c.high;
  }
  s.high = high;
  s.percentFromHigh = (high > 0.0) ? (high - s.current) / high * 100.0 : 0.0;
  return s;
}

std::vector<TableRow> tableRows(const TableStats& stats) {
  return {
    {"Current Price", formatPrice(stats.current)},
    {"High (in plot)", formatPrice(stats.high)},
    {"% from High", formatPercent(stats.percentFromHigh)}
  };
}

} // namespace qc
