#include "qc/export/PngEncoder.hpp"
#include <algorithm>
#include <array>
#include <cstddef>

namespace qc {

namespace {

constexpr std::uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t kMaxStoredBlock = 65535;

const std::array<std::uint32_t, 256>& crcTable() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) {
        c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      }
      t[n] = c;
    }
    return t;
  }();
  return table;
}

void appendBE32(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>(v >> 16));
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v));
}

// length, type, data, CRC(type + data)
void appendChunk(std::vector<std::uint8_t>& out, const char (&type)[5],
                 const std::vector<std::uint8_t>& data) {
  appendBE32(out, static_cast<std::uint32_t>(data.size()));
  const std::size_t crcStart = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), data.begin(), data.end());
  appendBE32(out, pngCrc32(out.data() + crcStart, out.size() - crcStart));
}

// Scanlines with filter type 0 (None) followed by RGB triples.
std::vector<std::uint8_t> scanlines(const std::uint8_t* rgba, int width, int height, bool flipY) {
  const std::size_t w = static_cast<std::size_t>(width);
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(height) * (1 + w * 3));

  for (int row = 0; row < height; row++) {
    const int src = flipY ? (height - 1 - row) : row;
    const std::uint8_t* p = rgba + static_cast<std::size_t>(src) * w * 4;
    raw.push_back(0);
    for (std::size_t x = 0; x < w; x++, p += 4) {
      raw.push_back(p[0]);
      raw.push_back(p[1]);
      raw.push_back(p[2]);
    }
  }
  return raw;
}

// zlib header, stored deflate blocks, Adler-32 trailer (RFC 1950/1951).
std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& raw) {
  const std::size_t blocks = std::max<std::size_t>(1, (raw.size() + kMaxStoredBlock - 1) / kMaxStoredBlock);
  std::vector<std::uint8_t> z;
  z.reserve(2 + blocks * 5 + raw.size() + 4);

  z.push_back(0x78);  // deflate, 32K window
  z.push_back(0x01);  // no dictionary; (0x78 << 8 | 0x01) % 31 == 0

  std::size_t offset = 0;
  do {
    const std::size_t n = std::min(raw.size() - offset, kMaxStoredBlock);
    const bool last = offset + n == raw.size();
    const std::uint16_t len = static_cast<std::uint16_t>(n);
    const std::uint16_t nlen = static_cast<std::uint16_t>(~len);

    z.push_back(last ? 0x01 : 0x00);  // BFINAL, BTYPE=00
    z.push_back(static_cast<std::uint8_t>(len & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen >> 8));
    z.insert(z.end(), raw.begin() + static_cast<std::ptrdiff_t>(offset),
             raw.begin() + static_cast<std::ptrdiff_t>(offset + n));
    offset += n;
  } while (offset < raw.size());

  appendBE32(z, zlibAdler32(raw.data(), raw.size()));
  return z;
}

} // namespace

std::uint32_t pngCrc32(const std::uint8_t* data, std::size_t len) {
  const auto& table = crcTable();
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = table[(c ^ data[i]) & 0xFFu] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t zlibAdler32(const std::uint8_t* data, std::size_t len) {
  constexpr std::uint32_t kMod = 65521u;
  constexpr std::size_t kNMax = 5552;  // bytes before the sums can overflow
  std::uint32_t a = 1, b = 0;
  while (len > 0) {
    const std::size_t n = std::min(len, kNMax);
    for (std::size_t i = 0; i < n; i++) {
      a += data[i];
      b += a;
    }
    a %= kMod;
    b %= kMod;
    data += n;
    len -= n;
  }
  return (b << 16) | a;
}

std::vector<std::uint8_t> encodePng(const std::uint8_t* rgba, int width, int height,
                                    const PngEncodeOptions& opts) {
  if (!rgba || width <= 0 || height <= 0) return {};

  std::vector<std::uint8_t> ihdr;
  ihdr.reserve(13);
  appendBE32(ihdr, static_cast<std::uint32_t>(width));
  appendBE32(ihdr, static_cast<std::uint32_t>(height));
  ihdr.push_back(8);  // bit depth
  ihdr.push_back(2);  // RGB
  ihdr.push_back(0);  // deflate
  ihdr.push_back(0);  // adaptive filtering
  ihdr.push_back(0);  // no interlace

  const std::vector<std::uint8_t> idat = zlibStored(scanlines(rgba, width, height, opts.flipY));

  std::vector<std::uint8_t> png;
  png.reserve(sizeof(kPngSignature) + 25 + idat.size() + 12 + 12);
  png.insert(png.end(), kPngSignature, kPngSignature + sizeof(kPngSignature));
  appendChunk(png, "IHDR", ihdr);
  appendChunk(png, "IDAT", idat);
  appendChunk(png, "IEND", {});
  return png;
}

} // namespace qc
