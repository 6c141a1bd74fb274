#pragma once
#include "qc/layout/Primitives.hpp"
#include "qc/recipe/Recipe.hpp"
#include <string>

namespace qc {

class GlyphAtlas;

// Turns one RenderLayer's primitives into a scene layer and its draw items.
//
// ID layout (offsets from idBase):
//   0: Layer
//   then 3 slots per draw item (Buffer, Geometry, DrawItem), in draw order:
//   rects (colorRect@1), triangles (colorTri@1), one lineAA@1 item per
//   distinct line width, text (textGlyph@1).
struct LayerRecipeConfig {
  Id paneId{0};
  Id transformId{0};  // 0 = no transform attached
  std::string name;
};

class LayerRecipe : public Recipe {
public:
  // idBase for a render layer: 1000 * (z + 1).
  static Id idBaseFor(RenderLayer layer) {
    return static_cast<Id>(1000) * (static_cast<Id>(layer) + 1);
  }

  // `atlas` must already hold every glyph the layer's text uses.
  LayerRecipe(Id idBase, const LayerRecipeConfig& config,
              const LayerPrimitives& prims, const GlyphAtlas* atlas);

  RecipeBuildResult build() const override;

  Id layerId() const { return rid(0); }

  static constexpr std::uint32_t kSlotsPerItem = 3;

private:
  LayerRecipeConfig config_;
  const LayerPrimitives& prims_;
  const GlyphAtlas* atlas_;

  void emitItem(RecipeBuildResult& result, std::uint32_t& slot,
                const char* pipeline, const char* format,
                std::uint32_t count, std::vector<float> data,
                float lineWidth) const;
};

} // namespace qc
