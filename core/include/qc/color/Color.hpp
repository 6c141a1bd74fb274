#pragma once
#include "qc/errors/Error.hpp"
#include <cstdint>
#include <string>

namespace qc {

struct Rgba {
  std::uint8_t r{0}, g{0}, b{0}, a{255};

  bool operator==(const Rgba& o) const {
    return r == o.r && g == o.g && b == o.b && a == o.a;
  }
  bool operator!=(const Rgba& o) const { return !(*this == o); }

  // Normalized [0..1] floats for GL uniforms / vertex attributes.
  void toFloat4(float out[4]) const {
    out[0] = static_cast<float>(r) / 255.0f;
    out[1] = static_cast<float>(g) / 255.0f;
    out[2] = static_cast<float>(b) / 255.0f;
    out[3] = static_cast<float>(a) / 255.0f;
  }
};

// Alpha applied when a color is given as #RRGGBB.
enum class AlphaPolicy : std::uint8_t {
  Opaque,  // every layer except zones
  Zone     // zones: 30% opacity
};

inline constexpr std::uint8_t kOpaqueAlpha = 255;
inline constexpr std::uint8_t kZoneDefaultAlpha = 77;  // lround(0.30 * 255)

inline constexpr Rgba kFallbackGray{128, 128, 128, 255};

struct ColorResult {
  bool ok{true};
  Rgba color{};
  Error err{};
};

// Parse "#RRGGBB" or "#RRGGBBAA" (hex digits in either case).
// Fails with InvalidColor on anything else; never substitutes a default.
ColorResult resolveColor(const std::string& hex, AlphaPolicy policy = AlphaPolicy::Opaque);

// Rendering-time variant: unparseable input yields `fallback`.
Rgba resolveColorOr(const std::string& hex, AlphaPolicy policy, Rgba fallback);

} // namespace qc
