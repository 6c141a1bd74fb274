#include "qc/text/TextLayout.hpp"
#include "qc/text/Utf8.hpp"

namespace qc {

float measureText(const GlyphAtlas& atlas, const std::string& text, float fontPx) {
  const float scale = fontPx / static_cast<float>(atlas.glyphPx());
  float width = 0.0f;
  for (std::uint32_t c : decodeUtf8(text)) {
    const GlyphInfo* g = atlas.getGlyph(c);
    if (g) width += g->advance * scale;
  }
  return width;
}

void layoutText(const GlyphAtlas& atlas, const std::string& text,
                float startX, float baselineY, float fontPx,
                const Rgba& color, TextLayoutResult& out) {
  const float scale = fontPx / static_cast<float>(atlas.glyphPx());
  float rgba[4];
  color.toFloat4(rgba);

  float cursorX = startX;
  for (std::uint32_t c : decodeUtf8(text)) {
    const GlyphInfo* g = atlas.getGlyph(c);
    if (!g) continue;
    if (g->w <= 0 || g->h <= 0) {
      cursorX += g->advance * scale;
      continue;
    }
    const float x0 = cursorX + g->bearingX * scale;
    const float y0 = baselineY - g->bearingY * scale;
    const float x1 = x0 + g->w * scale;
    const float y1 = y0 + g->h * scale;

    const float inst[12] = {x0, y0, x1, y1,
                            g->u0, g->v0, g->u1, g->v1,
                            rgba[0], rgba[1], rgba[2], rgba[3]};
    out.glyphInstances.insert(out.glyphInstances.end(), inst, inst + 12);
    out.glyphCount++;
    cursorX += g->advance * scale;
  }
  out.advanceWidth += cursorX - startX;
}

void layoutAnchoredText(const GlyphAtlas& atlas, const std::string& text,
                        float x, float centerY, float fontPx, TextAlign align,
                        const Rgba& color, TextLayoutResult& out) {
  const float width = measureText(atlas, text, fontPx);
  float startX = x;
  if (align == TextAlign::Center)     startX = x - width * 0.5f;
  else if (align == TextAlign::Right) startX = x - width;

  // Centre the ascent..descent box on centerY.
  const float scale = fontPx / static_cast<float>(atlas.glyphPx());
  const float baselineY = centerY + (atlas.ascent() + atlas.descent()) * 0.5f * scale;
  layoutText(atlas, text, startX, baselineY, fontPx, color, out);
}

} // namespace qc
