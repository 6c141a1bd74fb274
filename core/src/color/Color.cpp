#include "qc/color/Color.hpp"

namespace qc {

namespace {

int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseByte(const std::string& s, std::size_t pos, std::uint8_t& out) {
  int hi = hexNibble(s[pos]);
  int lo = hexNibble(s[pos + 1]);
  if (hi < 0 || lo < 0) return false;
  out = static_cast<std::uint8_t>((hi << 4) | lo);
  return true;
}

ColorResult invalid(const std::string& hex) {
  ColorResult r;
  r.ok = false;
  r.err.code = ErrorCode::InvalidColor;
  r.err.message = "invalid color \"" + hex + "\" (expected #RRGGBB or #RRGGBBAA)";
  return r;
}

} // anonymous namespace

ColorResult resolveColor(const std::string& hex, AlphaPolicy policy) {
  if (hex.size() != 7 && hex.size() != 9) return invalid(hex);
  if (hex[0] != '#') return invalid(hex);

  ColorResult r;
  if (!parseByte(hex, 1, r.color.r) ||
      !parseByte(hex, 3, r.color.g) ||
      !parseByte(hex, 5, r.color.b)) {
    return invalid(hex);
  }

  if (hex.size() == 9) {
    if (!parseByte(hex, 7, r.color.a)) return invalid(hex);
  } else {
    r.color.a = (policy == AlphaPolicy::Zone) ? kZoneDefaultAlpha : kOpaqueAlpha;
  }
  return r;
}

Rgba resolveColorOr(const std::string& hex, AlphaPolicy policy, Rgba fallback) {
  ColorResult r = resolveColor(hex, policy);
  return r.ok ? r.color : fallback;
}

} // namespace qc
