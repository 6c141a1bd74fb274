#include "qc/text/GlyphAtlas.hpp"
#include "qc/text/Utf8.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace qc {

GlyphAtlas::GlyphAtlas(const GlyphAtlasConfig& config)
  : atlasSize_(config.atlasSize), glyphPx_(config.glyphPx),
    sdfRange_(config.sdfRange), useSdf_(config.useSdf) {
  reset();
}

void GlyphAtlas::reset() {
  atlas_.assign(static_cast<std::size_t>(atlasSize_) * atlasSize_, 0);
  shelves_.clear();
  shelves_.push_back({1, 1, 0});
  glyphs_.clear();
  dirty_ = true;
}

bool GlyphAtlas::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;
  fontData_.assign(data, data + len);

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), stbtt_GetFontOffsetForIndex(fontData_.data(), 0))) {
    std::fprintf(stderr, "GlyphAtlas: not a TrueType font (%u bytes)\n", len);
    fontData_.clear();
    fontLoaded_ = false;
    return false;
  }

  int asc = 0, desc = 0, gap = 0;
  stbtt_GetFontVMetrics(&font, &asc, &desc, &gap);
  const float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  ascent_ = static_cast<float>(asc) * scale;
  descent_ = static_cast<float>(desc) * scale;

  reset();
  fontLoaded_ = true;
  return true;
}

bool GlyphAtlas::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas: cannot open font %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) return false;
  return loadFont(bytes.data(), static_cast<std::uint32_t>(bytes.size()));
}

bool GlyphAtlas::ensureAscii() {
  std::vector<std::uint32_t> cp;
  for (std::uint32_t c = 32; c <= 126; c++) cp.push_back(c);
  return ensureGlyphs(cp.data(), static_cast<std::uint32_t>(cp.size()));
}

bool GlyphAtlas::ensureText(const std::string& text) {
  std::vector<std::uint32_t> cp;
  for (std::uint32_t c : decodeUtf8(text)) {
    if (glyphs_.find(c) == glyphs_.end()) cp.push_back(c);
  }
  if (cp.empty()) return false;
  return ensureGlyphs(cp.data(), static_cast<std::uint32_t>(cp.size()));
}

bool GlyphAtlas::ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count) {
  if (!fontLoaded_) return false;

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), stbtt_GetFontOffsetForIndex(fontData_.data(), 0))) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }

  const float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  // SDF glyphs carry a border so the field can fall off outside the outline.
  const std::uint32_t spread = useSdf_ ? sdfRange_ : 0;
  const float invAtlas = 1.0f / static_cast<float>(atlasSize_);
  bool modified = false;

  for (std::uint32_t i = 0; i < count; i++) {
    const std::uint32_t cp = codepoints[i];
    if (glyphs_.find(cp) != glyphs_.end()) continue;

    const int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));

    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);

    int ix0, iy0, ix1, iy1;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);
    const int gw = ix1 - ix0;
    const int gh = iy1 - iy0;

    GlyphInfo info;
    info.codepoint = cp;
    info.advance = static_cast<float>(advW) * scale;

    if (gw <= 0 || gh <= 0) {
      // Whitespace: metrics only.
      glyphs_[cp] = info;
      continue;
    }

    const std::uint32_t bw = static_cast<std::uint32_t>(gw) + spread * 2;
    const std::uint32_t bh = static_cast<std::uint32_t>(gh) + spread * 2;
    std::vector<std::uint8_t> coverage(static_cast<std::size_t>(bw) * bh, 0);
    stbtt_MakeGlyphBitmap(&font, &coverage[static_cast<std::size_t>(spread) * bw + spread],
                          gw, gh, static_cast<int>(bw), scale, scale, glyphIdx);

    std::vector<std::uint8_t> cell(coverage.size());
    if (useSdf_) {
      buildSdfR8(coverage.data(), bw, bh, sdfRange_, cell.data());
    } else {
      cell = coverage;
    }

    std::uint32_t ax = 0, ay = 0;
    if (!packGlyph(bw + pad_ * 2, bh + pad_ * 2, ax, ay)) {
      std::fprintf(stderr, "GlyphAtlas: atlas full (cp=%u)\n", cp);
      continue;
    }

    for (std::uint32_t row = 0; row < bh; row++) {
      const std::size_t dst = static_cast<std::size_t>(ay + pad_ + row) * atlasSize_ + ax + pad_;
      std::memcpy(&atlas_[dst], &cell[static_cast<std::size_t>(row) * bw], bw);
    }

    info.u0 = static_cast<float>(ax + pad_) * invAtlas;
    info.v0 = static_cast<float>(ay + pad_) * invAtlas;
    info.u1 = static_cast<float>(ax + pad_ + bw) * invAtlas;
    info.v1 = static_cast<float>(ay + pad_ + bh) * invAtlas;
    info.bearingX = static_cast<float>(ix0) - static_cast<float>(spread);
    info.bearingY = static_cast<float>(-iy0) + static_cast<float>(spread);
    info.w = static_cast<float>(bw);
    info.h = static_cast<float>(bh);
    glyphs_[cp] = info;
    modified = true;
  }

  if (modified) dirty_ = true;
  return modified;
}

const GlyphInfo* GlyphAtlas::getGlyph(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  return it == glyphs_.end() ? nullptr : &it->second;
}

bool GlyphAtlas::packGlyph(std::uint32_t w, std::uint32_t h,
                           std::uint32_t& outX, std::uint32_t& outY) {
  for (auto& shelf : shelves_) {
    if (shelf.x + w <= atlasSize_ - 1 && shelf.y + h <= atlasSize_ - 1) {
      if (shelf.h == 0) shelf.h = h;
      if (h <= shelf.h) {
        outX = shelf.x;
        outY = shelf.y;
        shelf.x += w;
        return true;
      }
    }
  }

  // New shelf
  const auto& last = shelves_.back();
  const std::uint32_t ny = last.y + last.h;
  if (ny + h > atlasSize_ - 1) return false;

  outX = 1;
  outY = ny;
  shelves_.push_back({1 + w, ny, h});
  return true;
}

// 2-pass chamfer distance transform. Zero cells are seeds.
void GlyphAtlas::distanceTransform(float* field, std::uint32_t w, std::uint32_t h) {
  constexpr float INF = 1e20f;
  constexpr float DIAG = 1.4142135f;

  for (std::uint32_t y = 0; y < h; y++) {
    for (std::uint32_t x = 0; x < w; x++) {
      const std::size_t i = static_cast<std::size_t>(y) * w + x;
      if (field[i] == 0.0f) continue;

      float d = INF;
      if (x > 0)              d = std::min(d, field[i - 1] + 1.0f);
      if (y > 0)              d = std::min(d, field[i - w] + 1.0f);
      if (x > 0 && y > 0)     d = std::min(d, field[i - w - 1] + DIAG);
      if (x + 1 < w && y > 0) d = std::min(d, field[i - w + 1] + DIAG);
      field[i] = d;
    }
  }

  for (std::uint32_t y = h; y-- > 0; ) {
    for (std::uint32_t x = w; x-- > 0; ) {
      const std::size_t i = static_cast<std::size_t>(y) * w + x;
      if (field[i] == 0.0f) continue;

      float d = field[i];
      if (x + 1 < w)              d = std::min(d, field[i + 1] + 1.0f);
      if (y + 1 < h)              d = std::min(d, field[i + w] + 1.0f);
      if (x + 1 < w && y + 1 < h) d = std::min(d, field[i + w + 1] + DIAG);
      if (x > 0 && y + 1 < h)     d = std::min(d, field[i + w - 1] + DIAG);
      field[i] = d;
    }
  }
}

void GlyphAtlas::buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                            std::uint32_t sdfRange, std::uint8_t* out) {
  const std::size_t n = static_cast<std::size_t>(w) * h;
  const float rangePx = static_cast<float>(std::max<std::uint32_t>(sdfRange, 1));

  // inside: distance to the nearest outside cell; outside: to the nearest inside cell.
  std::vector<float> inside(n);
  std::vector<float> outside(n);
  for (std::size_t i = 0; i < n; i++) {
    const bool isIn = alpha[i] > 127;
    inside[i]  = isIn ? 1.0f : 0.0f;
    outside[i] = isIn ? 0.0f : 1.0f;
  }

  distanceTransform(inside.data(), w, h);
  distanceTransform(outside.data(), w, h);

  for (std::size_t i = 0; i < n; i++) {
    const float sd = inside[i] - outside[i];  // > 0 inside
    const float clamped = std::max(-rangePx, std::min(rangePx, sd));
    const float v = 128.0f + (clamped / rangePx) * 127.0f;
    out[i] = static_cast<std::uint8_t>(std::max(0.0f, std::min(255.0f, v)));
  }
}

} // namespace qc
