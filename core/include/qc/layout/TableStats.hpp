#pragma once
#include "qc/request/ChartRequest.hpp"
#include <string>
#include <vector>

namespace qc {

struct TableStats {
  double current{0};          // last close
  double high{0};             // max high in the plot
  double percentFromHigh{0};  // (high - current) / high * 100
  bool up{true};              // last close >= previous close (one candle: close >= open)
};

struct TableRow {
  std::string label;
  std::string value;
};

// Candles must be non-empty.
TableStats computeTableStats(const std::vector<Candle>& candles);

// "Current Price", "High (in plot)", "% from High".
std::vector<TableRow> tableRows(const TableStats& stats);

} // namespace qc
