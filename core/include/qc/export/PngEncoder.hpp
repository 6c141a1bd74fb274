#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace qc {

// PNG color type 2 (RGB, 8 bits per channel), no interlace.
// The zlib stream uses stored (uncompressed) deflate blocks, so no zlib or
// libpng is needed.
struct PngEncodeOptions {
  bool flipY{false};  // input rows are bottom-up (GL readback)
};

// Encode RGBA8 pixels (alpha dropped) into a complete PNG file image.
// Returns an empty vector when the dimensions or the pixel buffer are invalid.
std::vector<std::uint8_t> encodePng(const std::uint8_t* rgba, int width, int height,
                                    const PngEncodeOptions& opts = {});

// PNG CRC-32 (ISO 3309) and zlib Adler-32, exposed for tests.
std::uint32_t pngCrc32(const std::uint8_t* data, std::size_t len);
std::uint32_t zlibAdler32(const std::uint8_t* data, std::size_t len);

} // namespace qc
