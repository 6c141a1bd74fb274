// Q4.3 — Text layout test
// UTF-8 decoding and one glyph quad per codepoint.

#include "qc/text/GlyphAtlas.hpp"
#include "qc/text/TextLayout.hpp"
#include "qc/text/Utf8.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

#ifndef FONT_PATH
#define FONT_PATH "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"
#endif

int main() {
  // ---- Test 1: decoding ----
  {
    requireTrue(qc::decodeUtf8("").empty(), "empty");
    requireTrue((qc::decodeUtf8("BTC") == std::vector<std::uint32_t>{'B', 'T', 'C'}), "ascii");
    requireTrue((qc::decodeUtf8("\xC3\xA9") == std::vector<std::uint32_t>{0xE9}), "2-byte e-acute");
    requireTrue((qc::decodeUtf8("\xE2\x82\xAC") == std::vector<std::uint32_t>{0x20AC}), "3-byte euro");
    requireTrue((qc::decodeUtf8("\xF0\x9F\x93\x88") == std::vector<std::uint32_t>{0x1F4C8}), "4-byte");

    auto dash = qc::decodeUtf8("BTC \xE2\x80\x94 4h");
    requireTrue(dash.size() == 8 && dash[4] == 0x2014, "em dash is one codepoint");

    requireTrue((qc::decodeUtf8("\x80") == std::vector<std::uint32_t>{qc::kReplacementChar}), "stray continuation");
    requireTrue((qc::decodeUtf8("\xE2\x82") == std::vector<std::uint32_t>{qc::kReplacementChar}), "truncated");
    requireTrue((qc::decodeUtf8("\xE2\x82Z") == std::vector<std::uint32_t>{qc::kReplacementChar, 'Z'}),
                "resumes after broken sequence");
    requireTrue((qc::decodeUtf8("\xC0\xAF") == std::vector<std::uint32_t>{qc::kReplacementChar}), "overlong");
    requireTrue((qc::decodeUtf8("\xED\xA0\x80") == std::vector<std::uint32_t>{qc::kReplacementChar}), "surrogate");
    requireTrue((qc::decodeUtf8("\xF4\x90\x80\x80") == std::vector<std::uint32_t>{qc::kReplacementChar}), "above U+10FFFF");
    requireTrue((qc::decodeUtf8("\xFF" "a") == std::vector<std::uint32_t>{qc::kReplacementChar, 'a'}), "invalid lead");
    std::printf("  Test 1 (utf-8 decode): PASS\n");
  }

  qc::GlyphAtlas atlas;
  if (!atlas.loadFontFile(FONT_PATH)) {
    std::printf("  Test 2 (glyph layout): SKIPPED (no font at %s)\n", FONT_PATH);
    std::printf("Q4.3 text_layout: ALL PASS\n");
    return 0;
  }

  // ---- Test 2: one glyph per codepoint ----
  {
    const std::string euro = "\xE2\x82\xAC";
    requireTrue(atlas.ensureText(euro), "atlas changed");
    requireTrue(atlas.glyphCount() == 1, "one glyph packed for the euro sign");
    requireTrue(atlas.getGlyph(0x20AC) != nullptr, "keyed by codepoint");
    requireTrue(atlas.getGlyph(0xE2) == nullptr, "no lead-byte glyph");

    qc::TextLayoutResult r;
    qc::layoutText(atlas, euro, 0.0f, 20.0f, 24.0f, qc::Rgba{0, 0, 0, 255}, r);
    requireTrue(r.glyphCount == 1, "one instance");
    requireTrue(r.glyphInstances.size() == 12, "glyph12");

    const float scale = 24.0f / static_cast<float>(atlas.glyphPx());
    const float adv = atlas.getGlyph(0x20AC)->advance * scale;
    requireTrue(std::fabs(qc::measureText(atlas, euro, 24.0f) - adv) < 1e-4f, "measure one advance");
    std::printf("  Test 2 (euro sign): PASS\n");
  }

  // ---- Test 3: mixed label ----
  {
    const std::string label = "BTC \xE2\x80\x94 4h";
    atlas.ensureText(label);
    // B T C space dash 4 h, plus the euro from Test 2.
    requireTrue(atlas.glyphCount() == 8, "distinct codepoints packed");

    qc::TextLayoutResult r;
    qc::layoutText(atlas, label, 0.0f, 20.0f, 24.0f, qc::Rgba{0, 0, 0, 255}, r);
    requireTrue(r.glyphCount == 6, "spaces advance without a quad");
    requireTrue(r.glyphInstances.size() == 6 * 12, "instance floats");
    requireTrue(std::fabs(r.advanceWidth - qc::measureText(atlas, label, 24.0f)) < 1e-3f,
                "layout advance matches measure");
    std::printf("  Test 3 (mixed label): PASS\n");
  }

  std::printf("Q4.3 text_layout: ALL PASS\n");
  return 0;
}
