#pragma once
#include <cstdint>

namespace qc {

// Scene resource id. Chart layers use 1000 * (z + 1) + slot.
using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

} // namespace qc
