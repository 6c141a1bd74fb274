// Q5.1 — Scene commands + LayerRecipe test
// Command validation, cascading deletes and the create/dispose cycle of a
// render layer.

#include "qc/commands/CommandProcessor.hpp"
#include "qc/recipe/LayerRecipe.hpp"
#include "qc/scene/ResourceRegistry.hpp"
#include "qc/scene/Scene.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // ---- Test 1: scene graph + validation ----
  {
    qc::Scene scene;
    qc::ResourceRegistry reg;
    qc::CommandProcessor cp(scene, reg);

    requireTrue(cp.applyJsonText(R"({"cmd":"createPane","id":1,"clearColor":[0,0,0,1]})").ok, "pane");
    requireTrue(scene.getPane(1)->hasClearColor, "clear color");
    requireTrue(cp.applyJsonText(R"({"cmd":"createLayer","id":10,"paneId":1})").ok, "layer");
    requireTrue(!cp.applyJsonText(R"({"cmd":"createLayer","id":11,"paneId":99})").ok, "bad parent");
    requireTrue(cp.applyJsonText(R"({"cmd":"createBuffer","id":100,"byteLength":64})").ok, "buffer");
    requireTrue(cp.applyJsonText(R"({"cmd":"createGeometry","id":101,"vertexBufferId":100,"format":"rect4_color4","vertexCount":2})").ok, "geometry");
    requireTrue(cp.applyJsonText(R"({"cmd":"createDrawItem","id":102,"layerId":10})").ok, "drawItem");

    auto r = cp.applyJsonText(R"({"cmd":"bindDrawItem","drawItemId":102,"pipeline":"colorTri@1","geometryId":101})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_VERTEX_FORMAT_MISMATCH", "format mismatch");

    r = cp.applyJsonText(R"({"cmd":"bindDrawItem","drawItemId":102,"pipeline":"nope@1","geometryId":101})");
    requireTrue(!r.ok && r.err.code == "UNKNOWN_PIPELINE", "unknown pipeline");

    requireTrue(cp.applyJsonText(R"({"cmd":"bindDrawItem","drawItemId":102,"pipeline":"colorRect@1","geometryId":101})").ok, "bind");

    requireTrue(cp.applyJsonText(R"({"cmd":"createGeometry","id":103,"vertexBufferId":100,"format":"rect4_color4","vertexCount":3})").ok, "geometry 103");
    r = cp.applyJsonText(R"({"cmd":"bindDrawItem","drawItemId":102,"pipeline":"colorRect@1","geometryId":103})");
    requireTrue(!r.ok && r.err.code == "VALIDATION_BUFFER_TOO_SMALL", "3 instances need 96 bytes");

    requireTrue(!cp.applyJsonText(R"({"cmd":"setDrawItemStyle","drawItemId":102,"lineWidth":0})").ok, "lineWidth > 0");
    requireTrue(!cp.applyJsonText(R"({"cmd":"createLayer","id":10,"paneId":1})").ok, "id taken");
    requireTrue(!cp.applyJsonText("not json").ok, "bad json");
    requireTrue(cp.applyJsonText(R"({"cmd":"frobnicate"})").err.code == "UNKNOWN_COMMAND", "unknown cmd");
    std::printf("  Test 1 (validation): PASS\n");
  }

  // ---- Test 2: transforms + cascading delete ----
  {
    qc::Scene scene;
    qc::ResourceRegistry reg;
    qc::CommandProcessor cp(scene, reg);

    auto r = cp.applyAll({
      R"({"cmd":"createPane","id":1})",
      R"({"cmd":"createLayer","id":10,"paneId":1})",
      R"({"cmd":"createDrawItem","id":11,"layerId":10})",
      R"({"cmd":"createTransform","id":2})",
      R"({"cmd":"setTransform","id":2,"sx":0.5,"sy":-0.25,"tx":-1,"ty":1})",
      R"({"cmd":"attachTransform","drawItemId":11,"transformId":2})",
    });
    requireTrue(r.ok, "applyAll");
    const qc::Transform* t = scene.getTransform(2);
    requireTrue(t->mat3[0] == 0.5f && t->mat3[4] == -0.25f, "scale");
    requireTrue(t->mat3[6] == -1.0f && t->mat3[7] == 1.0f, "translation column-major");
    requireTrue(scene.getDrawItem(11)->transformId == 2, "attached");

    requireTrue(cp.applyJsonText(R"({"cmd":"delete","id":1})").ok, "delete pane");
    requireTrue(!scene.hasLayer(10) && !scene.hasDrawItem(11), "cascade");
    requireTrue(!reg.exists(10) && !reg.exists(11), "ids released");
    requireTrue(scene.hasTransform(2), "transform survives");
    requireTrue(cp.listResourcesJson() == R"({"panes":[],"layers":[],"drawItems":[],"buffers":[],"geometries":[],"transforms":[2]})",
                "listResourcesJson");
    std::printf("  Test 2 (transforms + delete): PASS\n");
  }

  // ---- Test 3: LayerRecipe create/dispose cycle ----
  {
    qc::Scene scene;
    qc::ResourceRegistry reg;
    qc::CommandProcessor cp(scene, reg);
    requireTrue(cp.applyJsonText(R"({"cmd":"createPane","id":1})").ok, "pane");
    requireTrue(cp.applyJsonText(R"({"cmd":"createTransform","id":2})").ok, "transform");

    qc::LayerPrimitives prims;
    prims.layer = qc::RenderLayer::Markers;
    qc::RectPrim rect; rect.x0 = 0; rect.y0 = 0; rect.x1 = 10; rect.y1 = 10;
    prims.rects.push_back(rect);
    prims.rects.push_back(rect);
    qc::TriPrim tri;
    prims.tris.push_back(tri);
    qc::LinePrim thin; thin.width = 1.0f;
    qc::LinePrim thick; thick.width = 3.0f;
    prims.lines = {thin, thick, thin};
    qc::TextPrim text; text.text = "ignored without an atlas";
    prims.texts.push_back(text);

    qc::LayerRecipeConfig cfg;
    cfg.paneId = 1;
    cfg.transformId = 2;
    cfg.name = "markers";
    const qc::Id base = qc::LayerRecipe::idBaseFor(qc::RenderLayer::Markers);
    requireTrue(base == 8000, "idBase = 1000 * (z + 1)");

    qc::LayerRecipe recipe(base, cfg, prims, nullptr);
    auto built = recipe.build();
    requireTrue(recipe.layerId() == 8000, "layer id");

    auto r = cp.applyAll(built.createCommands);
    requireTrue(r.ok, "create commands apply");
    requireTrue(scene.hasLayer(8000), "layer");

    // rects, tris, lines@1, lines@3
    requireTrue(built.buffers.size() == 4, "4 draw items");
    requireTrue(built.buffers[0].data.size() == 2 * 8, "rect floats");
    requireTrue(built.buffers[1].data.size() == 3 * 6, "tri floats");
    requireTrue(built.buffers[2].data.size() == 2 * 8, "two 1px lines");
    requireTrue(built.buffers[3].data.size() == 1 * 8, "one 3px line");

    const qc::DrawItem* rects = scene.getDrawItem(8003);
    requireTrue(rects && rects->pipeline == "colorRect@1", "rect draw item");
    requireTrue(rects->transformId == 2, "transform attached");
    requireTrue(scene.getDrawItem(8006)->pipeline == "colorTri@1", "tri draw item");
    requireTrue(scene.getGeometry(8005)->vertexCount == 3, "3 tri vertices");
    requireTrue(scene.getDrawItem(8009)->lineWidth == 1.0f, "thin group");
    requireTrue(scene.getDrawItem(8012)->lineWidth == 3.0f, "thick group");

    auto ids = scene.drawItemIds();
    requireTrue(ids.size() == 4 && ids[0] < ids[1] && ids[1] < ids[2], "ascending draw order");

    r = cp.applyAll(built.disposeCommands);
    requireTrue(r.ok, "dispose commands apply");
    requireTrue(scene.layerIds().empty() && scene.drawItemIds().empty(), "layer gone");
    requireTrue(!scene.hasBuffer(8001) && !scene.hasGeometry(8002), "buffers/geometry gone");
    requireTrue(scene.hasPane(1) && scene.hasTransform(2), "shared resources kept");
    std::printf("  Test 3 (layer recipe): PASS\n");
  }

  std::printf("Q5.1 scene_commands: ALL PASS\n");
  return 0;
}
