#pragma once
#include "qc/color/Color.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

// One OHLCV bar. low <= open, close <= high is assumed, not enforced.
struct Candle {
  std::int64_t timestamp{0};  // epoch milliseconds
  double open{0}, high{0}, low{0}, close{0};
  double volume{0};
};

enum class MarkerPosition : std::uint8_t {
  Above = 1,  // downward-pointing triangle above the high
  Below = 2   // upward-pointing triangle below the low
};

struct Marker {
  std::int64_t time{0};
  MarkerPosition position{MarkerPosition::Above};
  Rgba color{};
  bool hasText{false};
  std::string text;
  double size{1.0};
};

// Price/time rectangle. x1/x2 and y1/y2 may come in any order.
struct Zone {
  std::int64_t x1{0}, x2{0};
  double y1{0}, y2{0};
  Rgba color{};  // resolved with AlphaPolicy::Zone
};

struct VLine {
  std::int64_t time{0};
  Rgba color{};
};

// Overlays grouped by kind; each list keeps the caller's order.
struct Plots {
  std::vector<Marker> marks;
  std::vector<Zone> zones;
  std::vector<VLine> vlines;
};

struct ChartRequest {
  std::string title;
  std::string ticker;
  std::string timeframe;
  std::vector<std::string> cols;

  std::vector<Candle> candles;            // caller order is canonical
  std::vector<Rgba> candleColors;         // one per candle after validation
  std::vector<std::string> volumeColors;  // raw; resolved at render time

  Plots plots;
  std::string desc;

  bool hasChatId{false};
  std::int64_t chatId{0};

  bool hasSubscriberList{false};
  std::string subscriberList;

  bool hasImageFilename{false};
  std::string imageFilename;
};

// Fallback body color for candles without a matching candle_colors entry.
inline constexpr Rgba kDefaultCandleColor{0, 0, 0, 255};

} // namespace qc
