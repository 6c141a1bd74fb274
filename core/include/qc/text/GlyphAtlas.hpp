#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace qc {

// Glyph metrics at the atlas rasterization size (glyphPx), y down.
struct GlyphInfo {
  std::uint32_t codepoint{0};
  // Atlas UVs [0..1]: (u0, v0) top-left, (u1, v1) bottom-right.
  float u0{0}, v0{0}, u1{0}, v1{0};
  float advance{0};
  float bearingX{0};  // pen x -> bitmap left
  float bearingY{0};  // baseline -> bitmap top (positive above the baseline)
  float w{0}, h{0};
};

struct GlyphAtlasConfig {
  std::uint32_t atlasSize{1024};  // square R8 texture
  std::uint32_t glyphPx{48};      // rasterization size; text scales from it
  std::uint32_t sdfRange{8};      // distance field spread in pixels
  bool useSdf{true};              // false = raw coverage
};

// R8 glyph atlas rasterized from a TrueType font with stb_truetype.
// Glyphs are keyed by Unicode codepoint.
class GlyphAtlas {
public:
  explicit GlyphAtlas(const GlyphAtlasConfig& config = GlyphAtlasConfig{});

  // TTF/OTF file. Clears previously packed glyphs.
  bool loadFontFile(const std::string& path);

  bool fontLoaded() const { return fontLoaded_; }

  // Printable ASCII (32..126). Returns true if the atlas changed.
  bool ensureAscii();

  // Every codepoint of a UTF-8 string.
  bool ensureText(const std::string& text);

  // nullptr if not rasterized.
  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  // Line metrics at glyphPx; descent is negative (below the baseline).
  float ascent() const { return ascent_; }
  float descent() const { return descent_; }

  // Atlas R8 pixel data, row 0 at the top.
  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }

  // True if atlas pixels changed since last call to clearDirty().
  bool isDirty() const { return dirty_; }
  void clearDirty() { dirty_ = false; }

  std::uint32_t glyphPx() const { return glyphPx_; }
  bool useSdf() const { return useSdf_; }
  std::size_t glyphCount() const { return glyphs_.size(); }

private:
  std::uint32_t atlasSize_;
  std::uint32_t glyphPx_;
  std::uint32_t sdfRange_;
  std::uint32_t pad_{2};
  bool useSdf_;

  std::vector<std::uint8_t> atlas_;    // R8 atlas (atlasSize_ x atlasSize_)
  std::vector<std::uint8_t> fontData_; // retained font file bytes
  bool fontLoaded_{false};
  bool dirty_{false};
  float ascent_{0};
  float descent_{0};

  std::unordered_map<std::uint32_t, GlyphInfo> glyphs_;

  // Shelf packer state
  struct Shelf {
    std::uint32_t x, y, h;
  };
  std::vector<Shelf> shelves_;

  void reset();
  bool loadFont(const std::uint8_t* data, std::uint32_t len);
  bool ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count);
  bool packGlyph(std::uint32_t w, std::uint32_t h,
                 std::uint32_t& outX, std::uint32_t& outY);

  // SDF helpers
  static void distanceTransform(float* field, std::uint32_t w, std::uint32_t h);
  static void buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                         std::uint32_t sdfRange, std::uint8_t* out);
};

} // namespace qc
