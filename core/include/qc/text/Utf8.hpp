#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

constexpr std::uint32_t kReplacementChar = 0xFFFD;

// UTF-8 -> codepoints. Truncated, overlong, surrogate and out-of-range
// sequences each become one U+FFFD; decoding resumes at the next byte that
// cannot continue the broken sequence.
std::vector<std::uint32_t> decodeUtf8(const std::string& text);

} // namespace qc
