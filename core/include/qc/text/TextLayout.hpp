#pragma once
#include "qc/color/Color.hpp"
#include "qc/layout/Primitives.hpp"
#include "qc/text/GlyphAtlas.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace qc {

struct TextLayoutResult {
  // glyph12 per glyph: x0,y0,x1,y1 (pixels, y down), u0,v0,u1,v1, r,g,b,a
  std::vector<float> glyphInstances;
  int glyphCount{0};
  float advanceWidth{0};
};

// Pen advance of a string at fontPx. Unknown glyphs contribute nothing.
float measureText(const GlyphAtlas& atlas, const std::string& text, float fontPx);

// Append glyph quads for `text` with its pen starting at startX and its
// baseline at baselineY (canvas pixels, y down).
void layoutText(const GlyphAtlas& atlas, const std::string& text,
                float startX, float baselineY, float fontPx,
                const Rgba& color, TextLayoutResult& out);

// Anchor-based placement: x per alignment, y = vertical centre of the line box.
void layoutAnchoredText(const GlyphAtlas& atlas, const std::string& text,
                        float x, float centerY, float fontPx, TextAlign align,
                        const Rgba& color, TextLayoutResult& out);

} // namespace qc
