#include "qc/text/Utf8.hpp"

namespace qc {

namespace {

bool isContinuation(unsigned char b) { return (b & 0xC0) == 0x80; }

} // namespace

std::vector<std::uint32_t> decodeUtf8(const std::string& text) {
  std::vector<std::uint32_t> out;
  out.reserve(text.size());

  const std::size_t n = text.size();
  std::size_t i = 0;
  while (i < n) {
    const unsigned char lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      out.push_back(lead);
      i++;
      continue;
    }

    std::size_t len = 0;
    std::uint32_t cp = 0;
    std::uint32_t minCp = 0;
    if ((lead & 0xE0) == 0xC0)      { len = 2; cp = lead & 0x1F; minCp = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; minCp = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; minCp = 0x10000; }
    else {
      // Stray continuation byte or 0xF8..0xFF.
      out.push_back(kReplacementChar);
      i++;
      continue;
    }

    std::size_t used = 1;
    while (used < len && i + used < n &&
           isContinuation(static_cast<unsigned char>(text[i + used]))) {
      cp = (cp << 6) | (static_cast<unsigned char>(text[i + used]) & 0x3F);
      used++;
    }
    i += used;

    if (used < len || cp < minCp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
      out.push_back(kReplacementChar);
    } else {
      out.push_back(cp);
    }
  }
  return out;
}

} // namespace qc
