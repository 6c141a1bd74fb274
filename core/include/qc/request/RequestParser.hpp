#pragma once
#include "qc/request/ChartRequest.hpp"
#include "qc/errors/Error.hpp"

#include <string>

#include <rapidjson/document.h>

namespace qc {

struct ParseResult {
  bool ok{true};
  Error err{};
  ChartRequest request{};
};

// Decodes and validates chart requests.
//
// Two entry points:
//   parseEnvelope(): the transport payload  ["chart", "request", {...}]
//   parseRequest():  the bare ChartRequest object
//
// MalformedRequest: bytes are not JSON / envelope is not a 3-element array.
// SchemaError:      required field missing or of the wrong shape.
// InvalidColor:     a candle, marker, zone or vline color does not parse.
class RequestParser {
public:
  ParseResult parseEnvelope(const std::string& bytes) const;
  ParseResult parseRequest(const std::string& bytes) const;
  ParseResult parseRequestValue(const rapidjson::Value& obj) const;

  // Prices <= 0 are clamped to this before they reach the log axis.
  static constexpr double kMinPrice = 1e-12;

private:
  struct ColumnMap {
    int timestamp{0}, open{1}, high{2}, low{3}, close{4}, volume{5};
  };

  static ColumnMap resolveColumns(const std::vector<std::string>& cols);

  static ParseResult fail(ErrorCode code, const std::string& message);

  bool readCandles(const rapidjson::Value& data, const ColumnMap& cm,
                   ChartRequest& out, Error& err) const;
  bool readPlots(const rapidjson::Value& plots, ChartRequest& out, Error& err) const;
  bool readMarker(const rapidjson::Value& v, std::size_t index, Marker& out, Error& err) const;
  bool readZone(const rapidjson::Value& v, std::size_t index, Zone& out, Error& err) const;
  bool readVLine(const rapidjson::Value& v, std::size_t index, VLine& out, Error& err) const;
};

} // namespace qc
