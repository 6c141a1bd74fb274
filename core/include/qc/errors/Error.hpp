#pragma once
#include <cstdint>
#include <string>

namespace qc {

enum class ErrorCode : std::uint8_t {
  None,
  MalformedRequest,  // payload is not decodable JSON / envelope
  SchemaError,       // required field missing or wrong shape
  InvalidColor,      // unparseable color string
  EmptySeries,       // no candles
  IoError,           // artifact could not be written
  RenderFailed       // drawing backend unavailable or failed
};

inline const char* toString(ErrorCode c) {
  switch (c) {
    case ErrorCode::None:             return "OK";
    case ErrorCode::MalformedRequest: return "MALFORMED_REQUEST";
    case ErrorCode::SchemaError:      return "SCHEMA_ERROR";
    case ErrorCode::InvalidColor:     return "INVALID_COLOR";
    case ErrorCode::EmptySeries:      return "EMPTY_SERIES";
    case ErrorCode::IoError:          return "IO_ERROR";
    case ErrorCode::RenderFailed:     return "RENDER_FAILED";
    default: return "UNKNOWN";
  }
}

struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;  // human text, includes the offending field/value
};

// Plain success/failure result, in the same shape as the command results.
struct Status {
  bool ok{true};
  Error err{};

  static Status success() { return Status{}; }
  static Status fail(ErrorCode code, const std::string& message) {
    Status s;
    s.ok = false;
    s.err.code = code;
    s.err.message = message;
    return s;
  }
};

} // namespace qc
