#include "qc/request/RequestParser.hpp"

#include <rapidjson/error/en.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace qc {

namespace {

const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

// Optional fields treat an explicit null the same as a missing key.
const rapidjson::Value* getOptional(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v || v->IsNull()) return nullptr;
  return v;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Integral JSON numbers pass through; doubles truncate toward zero and must
// land inside the int64 range.
bool readTimestamp(const rapidjson::Value& v, const std::string& where,
                   std::int64_t& out, Error& err) {
  if (v.IsInt64()) {
    out = v.GetInt64();
    return true;
  }
  if (!v.IsUint64()) {
    const double d = v.GetDouble();
    if (d >= -9223372036854775808.0 && d < 9223372036854775808.0) {
      out = static_cast<std::int64_t>(d);
      return true;
    }
  }
  err.code = ErrorCode::SchemaError;
  err.message = where + " is outside the int64 timestamp range";
  return false;
}

double clampPrice(double p) {
  return (p > RequestParser::kMinPrice) ? p : RequestParser::kMinPrice;
}

bool requireString(const rapidjson::Value& obj, const char* key,
                   std::string& out, Error& err) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsString()) {
    err.code = ErrorCode::SchemaError;
    err.message = std::string("missing or non-string field: ") + key;
    return false;
  }
  out.assign(v->GetString(), v->GetStringLength());
  return true;
}

bool readStringArray(const rapidjson::Value& v, const char* key,
                     std::vector<std::string>& out, Error& err) {
  if (!v.IsArray()) {
    err.code = ErrorCode::SchemaError;
    err.message = std::string("field is not an array: ") + key;
    return false;
  }
  out.clear();
  out.reserve(v.Size());
  for (rapidjson::SizeType i = 0; i < v.Size(); i++) {
    if (!v[i].IsString()) {
      err.code = ErrorCode::SchemaError;
      err.message = std::string(key) + "[" + std::to_string(i) + "] is not a string";
      return false;
    }
    out.emplace_back(v[i].GetString(), v[i].GetStringLength());
  }
  return true;
}

bool resolveInto(const std::string& hex, AlphaPolicy policy, const std::string& where,
                 Rgba& out, Error& err) {
  ColorResult cr = resolveColor(hex, policy);
  if (!cr.ok) {
    err = cr.err;
    err.message = where + ": " + err.message;
    return false;
  }
  out = cr.color;
  return true;
}

} // anonymous namespace

ParseResult RequestParser::fail(ErrorCode code, const std::string& message) {
  ParseResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

ParseResult RequestParser::parseEnvelope(const std::string& bytes) const {
  rapidjson::Document d;
  d.Parse(bytes.data(), bytes.size());
  if (d.HasParseError()) {
    return fail(ErrorCode::MalformedRequest,
                std::string("envelope is not valid JSON: ") +
                rapidjson::GetParseError_En(d.GetParseError()) +
                " at offset " + std::to_string(d.GetErrorOffset()));
  }
  if (!d.IsArray() || d.Size() != 3) {
    return fail(ErrorCode::MalformedRequest,
                "envelope must be a 3-element array [\"chart\", \"request\", {...}]");
  }
  if (!d[0].IsString() || !d[1].IsString() ||
      std::string(d[0].GetString()) != "chart" ||
      std::string(d[1].GetString()) != "request") {
    return fail(ErrorCode::SchemaError, "unsupported message (expected \"chart\", \"request\")");
  }
  if (!d[2].IsObject()) {
    return fail(ErrorCode::SchemaError, "envelope payload is not an object");
  }
  return parseRequestValue(d[2]);
}

ParseResult RequestParser::parseRequest(const std::string& bytes) const {
  rapidjson::Document d;
  d.Parse(bytes.data(), bytes.size());
  if (d.HasParseError()) {
    return fail(ErrorCode::MalformedRequest,
                std::string("request is not valid JSON: ") +
                rapidjson::GetParseError_En(d.GetParseError()) +
                " at offset " + std::to_string(d.GetErrorOffset()));
  }
  if (!d.IsObject()) {
    return fail(ErrorCode::SchemaError, "request is not a JSON object");
  }
  return parseRequestValue(d);
}

ParseResult RequestParser::parseRequestValue(const rapidjson::Value& obj) const {
  ParseResult r;
  ChartRequest& req = r.request;
  Error err;

  if (!requireString(obj, "title", req.title, err) ||
      !requireString(obj, "ticker", req.ticker, err) ||
      !requireString(obj, "timeframe", req.timeframe, err) ||
      !requireString(obj, "desc", req.desc, err)) {
    return fail(err.code, err.message);
  }

  const auto* cols = getMember(obj, "cols");
  if (!cols) return fail(ErrorCode::SchemaError, "missing field: cols");
  if (!readStringArray(*cols, "cols", req.cols, err)) return fail(err.code, err.message);

  const auto* data = getMember(obj, "data");
  if (!data || !data->IsArray()) {
    return fail(ErrorCode::SchemaError, "missing or non-array field: data");
  }

  const auto* candleColors = getMember(obj, "candle_colors");
  if (!candleColors) return fail(ErrorCode::SchemaError, "missing field: candle_colors");
  std::vector<std::string> candleHex;
  if (!readStringArray(*candleColors, "candle_colors", candleHex, err)) {
    return fail(err.code, err.message);
  }

  const auto* plots = getMember(obj, "plots");
  if (!plots || !plots->IsObject()) {
    return fail(ErrorCode::SchemaError, "missing or non-object field: plots");
  }

  if (!readCandles(*data, resolveColumns(req.cols), req, err)) {
    return fail(err.code, err.message);
  }

  // Candle colors: validated here (abort on garbage); length mismatch tolerated.
  req.candleColors.assign(req.candles.size(), kDefaultCandleColor);
  for (std::size_t i = 0; i < candleHex.size() && i < req.candles.size(); i++) {
    if (!resolveInto(candleHex[i], AlphaPolicy::Opaque,
                     "candle_colors[" + std::to_string(i) + "]",
                     req.candleColors[i], err)) {
      return fail(err.code, err.message);
    }
  }

  if (const auto* vc = getOptional(obj, "volume_colors")) {
    if (!readStringArray(*vc, "volume_colors", req.volumeColors, err)) {
      return fail(err.code, err.message);
    }
  }

  if (!readPlots(*plots, req, err)) return fail(err.code, err.message);

  if (const auto* v = getOptional(obj, "chat_id")) {
    if (!v->IsInt64()) return fail(ErrorCode::SchemaError, "chat_id is not an integer");
    req.hasChatId = true;
    req.chatId = v->GetInt64();
  }
  if (const auto* v = getOptional(obj, "subscriber_list")) {
    if (!v->IsString()) return fail(ErrorCode::SchemaError, "subscriber_list is not a string");
    req.hasSubscriberList = true;
    req.subscriberList.assign(v->GetString(), v->GetStringLength());
  }
  if (const auto* v = getOptional(obj, "image_filename")) {
    if (!v->IsString()) return fail(ErrorCode::SchemaError, "image_filename is not a string");
    req.imageFilename.assign(v->GetString(), v->GetStringLength());
    req.hasImageFilename = !req.imageFilename.empty();
  }

  return r;
}

RequestParser::ColumnMap RequestParser::resolveColumns(const std::vector<std::string>& cols) {
  ColumnMap positional;
  ColumnMap named;
  named.timestamp = named.open = named.high = named.low = named.close = named.volume = -1;

  for (std::size_t i = 0; i < cols.size(); i++) {
    const std::string c = lower(cols[i]);
    const int idx = static_cast<int>(i);
    if (c == "timestamp" || c == "time" || c == "t")  named.timestamp = idx;
    else if (c == "open" || c == "o")                named.open = idx;
    else if (c == "high" || c == "h")                named.high = idx;
    else if (c == "low" || c == "l")                 named.low = idx;
    else if (c == "close" || c == "c")               named.close = idx;
    else if (c == "volume" || c == "v")              named.volume = idx;
  }

  // Only trust cols when it names every price column.
  if (named.timestamp < 0 || named.open < 0 || named.high < 0 ||
      named.low < 0 || named.close < 0) {
    return positional;
  }
  return named;
}

bool RequestParser::readCandles(const rapidjson::Value& data, const ColumnMap& cm,
                                ChartRequest& out, Error& err) const {
  const int required = std::max({cm.timestamp, cm.open, cm.high, cm.low, cm.close}) + 1;

  out.candles.clear();
  out.candles.reserve(data.Size());

  for (rapidjson::SizeType i = 0; i < data.Size(); i++) {
    const auto& row = data[i];
    const std::string where = "data[" + std::to_string(i) + "]";
    if (!row.IsArray()) {
      err.code = ErrorCode::SchemaError;
      err.message = where + " is not an array";
      return false;
    }
    if (static_cast<int>(row.Size()) < required) {
      err.code = ErrorCode::SchemaError;
      err.message = where + " has " + std::to_string(row.Size()) +
                    " columns, expected at least " + std::to_string(required);
      return false;
    }
    for (rapidjson::SizeType j = 0; j < row.Size(); j++) {
      if (!row[j].IsNumber()) {
        err.code = ErrorCode::SchemaError;
        err.message = where + "[" + std::to_string(j) + "] is not a number";
        return false;
      }
    }

    auto cell = [&](int idx) { return row[static_cast<rapidjson::SizeType>(idx)].GetDouble(); };

    Candle c;
    if (!readTimestamp(row[static_cast<rapidjson::SizeType>(cm.timestamp)],
                       where + "[" + std::to_string(cm.timestamp) + "]", c.timestamp, err)) {
      return false;
    }
    c.open  = clampPrice(cell(cm.open));
    c.high  = clampPrice(cell(cm.high));
    c.low   = clampPrice(cell(cm.low));
    c.close = clampPrice(cell(cm.close));
    c.volume = (cm.volume >= 0 && cm.volume < static_cast<int>(row.Size()))
               ? cell(cm.volume) : 0.0;
    out.candles.push_back(c);
  }
  return true;
}

bool RequestParser::readPlots(const rapidjson::Value& plots, ChartRequest& out,
                              Error& err) const {
  const auto* marks = getOptional(plots, "marks");
  if (!marks) marks = getOptional(plots, "markers");
  if (marks) {
    if (!marks->IsArray()) {
      err.code = ErrorCode::SchemaError;
      err.message = "plots.marks is not an array";
      return false;
    }
    for (rapidjson::SizeType i = 0; i < marks->Size(); i++) {
      Marker m;
      if (!readMarker((*marks)[i], i, m, err)) return false;
      out.plots.marks.push_back(std::move(m));
    }
  }

  if (const auto* zones = getOptional(plots, "zones")) {
    if (!zones->IsArray()) {
      err.code = ErrorCode::SchemaError;
      err.message = "plots.zones is not an array";
      return false;
    }
    for (rapidjson::SizeType i = 0; i < zones->Size(); i++) {
      Zone z;
      if (!readZone((*zones)[i], i, z, err)) return false;
      out.plots.zones.push_back(z);
    }
  }

  if (const auto* vlines = getOptional(plots, "vlines")) {
    if (!vlines->IsArray()) {
      err.code = ErrorCode::SchemaError;
      err.message = "plots.vlines is not an array";
      return false;
    }
    for (rapidjson::SizeType i = 0; i < vlines->Size(); i++) {
      VLine vl;
      if (!readVLine((*vlines)[i], i, vl, err)) return false;
      out.plots.vlines.push_back(vl);
    }
  }
  return true;
}

bool RequestParser::readMarker(const rapidjson::Value& v, std::size_t index,
                               Marker& out, Error& err) const {
  const std::string where = "plots.marks[" + std::to_string(index) + "]";
  if (!v.IsObject()) {
    err.code = ErrorCode::SchemaError;
    err.message = where + " is not an object";
    return false;
  }

  const auto* time = getMember(v, "time");
  if (!time || !time->IsNumber()) {
    err.code = ErrorCode::SchemaError;
    err.message = where + ".time missing or not a number";
    return false;
  }
  if (!readTimestamp(*time, where + ".time", out.time, err)) return false;

  std::string position;
  if (!requireString(v, "position", position, err)) {
    err.message = where + ": " + err.message;
    return false;
  }
  position = lower(position);
  if (position == "above") {
    out.position = MarkerPosition::Above;
  } else if (position == "below") {
    out.position = MarkerPosition::Below;
  } else {
    err.code = ErrorCode::SchemaError;
    err.message = where + ".position must be \"above\" or \"below\"";
    return false;
  }

  std::string color;
  if (!requireString(v, "color", color, err)) {
    err.message = where + ": " + err.message;
    return false;
  }
  if (!resolveInto(color, AlphaPolicy::Opaque, where + ".color", out.color, err)) return false;

  if (const auto* text = getOptional(v, "text")) {
    if (!text->IsString()) {
      err.code = ErrorCode::SchemaError;
      err.message = where + ".text is not a string";
      return false;
    }
    out.hasText = true;
    out.text.assign(text->GetString(), text->GetStringLength());
  }

  if (const auto* size = getOptional(v, "size")) {
    if (!size->IsNumber() || !(size->GetDouble() > 0.0)) {
      err.code = ErrorCode::SchemaError;
      err.message = where + ".size must be a positive number";
      return false;
    }
    out.size = size->GetDouble();
  }
  return true;
}

bool RequestParser::readZone(const rapidjson::Value& v, std::size_t index,
                             Zone& out, Error& err) const {
  const std::string where = "plots.zones[" + std::to_string(index) + "]";
  if (!v.IsObject()) {
    err.code = ErrorCode::SchemaError;
    err.message = where + " is not an object";
    return false;
  }

  const char* keys[] = {"x1", "x2", "y1", "y2"};
  for (const char* key : keys) {
    const auto* f = getMember(v, key);
    if (!f || !f->IsNumber()) {
      err.code = ErrorCode::SchemaError;
      err.message = where + "." + key + " missing or not a number";
      return false;
    }
  }
  if (!readTimestamp(v["x1"], where + ".x1", out.x1, err)) return false;
  if (!readTimestamp(v["x2"], where + ".x2", out.x2, err)) return false;
  out.y1 = v["y1"].GetDouble();
  out.y2 = v["y2"].GetDouble();

  std::string color;
  if (!requireString(v, "color", color, err)) {
    err.message = where + ": " + err.message;
    return false;
  }
  return resolveInto(color, AlphaPolicy::Zone, where + ".color", out.color, err);
}

bool RequestParser::readVLine(const rapidjson::Value& v, std::size_t index,
                              VLine& out, Error& err) const {
  const std::string where = "plots.vlines[" + std::to_string(index) + "]";
  if (!v.IsObject()) {
    err.code = ErrorCode::SchemaError;
    err.message = where + " is not an object";
    return false;
  }

  const auto* time = getMember(v, "time");
  if (!time || !time->IsNumber()) {
    err.code = ErrorCode::SchemaError;
    err.message = where + ".time missing or not a number";
    return false;
  }
  if (!readTimestamp(*time, where + ".time", out.time, err)) return false;

  std::string color;
  if (!requireString(v, "color", color, err)) {
    err.message = where + ": " + err.message;
    return false;
  }
  return resolveInto(color, AlphaPolicy::Opaque, where + ".color", out.color, err);
}

} // namespace qc
