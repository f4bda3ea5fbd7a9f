// S5.1 - Scene JSON serialization
// Tests:
//   1. Round trip keeps structure, flags, operators, styles and text payloads
//   2. excludeChildren drops the children array but keeps group fields
//   3. Matrices: kept on leaves and non-transforming groups, pushed down otherwise
//   4. Malformed input is reported through LoadResult
//   5. File save / load

#include "sg/io/SceneJson.hpp"
#include "sg/scene/AreaText.hpp"
#include "sg/scene/Group.hpp"
#include "sg/scene/Path.hpp"
#include "sg/scene/TextItem.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static std::unique_ptr<sg::Group> sampleScene() {
  auto g = std::make_unique<sg::Group>();
  g->setName("root");
  g->setCompositing(sg::CompositeOp::DestinationOut);

  auto content = sg::Path::rectangle({0, 0, 50, 40});
  content->setFillColor(sg::Color::rgb(1, 0, 0));
  g->addChild(std::move(content));

  auto mask = sg::Path::rectangle({10, 10, 20, 20});
  mask->setName("mask");
  mask->setClipMask(true);
  g->addChild(std::move(mask));

  sg::AreaTextConfig cfg;
  cfg.frame = {5, 5, 80, 60};
  cfg.content = "line one\nline two";
  cfg.style.fillColor = sg::Color{0, 0, 1, 0.5f};
  cfg.style.fontSize = 16.0f;
  cfg.style.leading = 20.0f;
  cfg.style.justification = sg::Justification::Right;
  auto text = std::make_unique<sg::AreaText>(cfg);
  text->setClippable(false);
  g->addChild(std::move(text));

  auto label = std::make_unique<sg::TextItem>(sg::Point{3, 4}, "label");
  label->setVisible(false);
  g->addChild(std::move(label));
  return g;
}

int main() {
  // ---- Test 1: Round trip ----
  {
    auto scene = sampleScene();
    std::string json = sg::toJSON(*scene);
    sg::LoadResult r = sg::fromJSON(json);
    requireTrue(r.ok, "load ok");
    requireTrue(r.error.empty(), "no error");
    requireTrue(r.node && r.node->kind() == sg::NodeKind::Group, "root group");

    auto* g = static_cast<sg::Group*>(r.node.get());
    requireTrue(g->name() == "root", "name");
    requireTrue(g->compositing() == sg::CompositeOp::DestinationOut, "compositing");
    requireTrue(g->childCount() == 4, "4 children");
    requireTrue(g->isClipped() && g->clipItems()[0] == g->childAt(1), "clip mask restored");
    requireTrue(g->childAt(1)->name() == "mask", "child name");

    auto* content = static_cast<sg::Path*>(g->childAt(0));
    requireTrue(content->kind() == sg::NodeKind::Path, "path kind");
    requireTrue(content->isClosed() && content->points().size() == 4, "path geometry");
    requireTrue(content->fillColor() && *content->fillColor() == sg::Color::rgb(1, 0, 0), "path fill");
    requireTrue(content->strokeColor() && *content->strokeColor() == sg::Color::black(), "path stroke");

    auto* area = static_cast<sg::AreaText*>(g->childAt(2));
    requireTrue(area->kind() == sg::NodeKind::AreaText, "area text kind");
    requireTrue(!area->isClippable(), "clippable flag");
    requireTrue(area->bounds() == (sg::Rect{5, 5, 80, 60}), "area frame");
    requireTrue(area->text() && area->text()->content() == "line one\nline two", "payload content");
    requireTrue(area->fontSize() == 16.0f && area->leading() == 20.0f, "font style");
    requireTrue(area->justification() == sg::Justification::Right, "justification");
    requireTrue(area->cssFillColor() && std::fabs(area->cssFillColor()->a - 0.5f) < 1e-6f, "translucent fill");
    requireTrue(area->cssFillColor() == area->style().fillColor, "cache in sync after load");
    requireTrue(area->text()->style().fontSize == 16.0f, "payload style synced");

    auto* label = static_cast<sg::TextItem*>(g->childAt(3));
    requireTrue(label->kind() == sg::NodeKind::TextItem, "text kind");
    requireTrue(!label->isVisible(), "visibility");
    requireTrue(label->point() == (sg::Point{3, 4}), "point");

    requireTrue(sg::toJSON(*g) == json, "second serialization is identical");
    std::printf("  Test 1 (round trip): PASS\n");
  }

  // ---- Test 2: excludeChildren ----
  {
    auto scene = sampleScene();
    sg::SerializeOptions opts;
    opts.excludeChildren = true;
    std::string json = sg::toJSON(*scene, opts);
    requireTrue(json.find("\"children\"") == std::string::npos, "no children key");
    requireTrue(json.find("destination-out") != std::string::npos, "group fields kept");

    sg::LoadResult r = sg::fromJSON(json);
    requireTrue(r.ok && r.node->childCount() == 0, "loads as empty group");
    std::printf("  Test 2 (excludeChildren): PASS\n");
  }

  // ---- Test 3: Matrices ----
  {
    sg::LoadResult leaf = sg::fromJSON(
      R"({"type":"Path","points":[[0,0],[10,0],[10,10]],"matrix":[1,0,0,1,5,6]})");
    requireTrue(leaf.ok, "leaf ok");
    requireTrue(leaf.node->matrix() == sg::Matrix::translation(5, 6), "leaf matrix");

    sg::LoadResult pushed = sg::fromJSON(
      R"({"type":"Group","matrix":[2,0,0,2,0,0],
          "children":[{"type":"Path","points":[[0,0],[1,1]]}]})");
    requireTrue(pushed.ok, "group ok");
    requireTrue(pushed.node->matrix().isIdentity(), "group matrix pushed down");
    requireTrue(pushed.node->firstChild()->matrix() == sg::Matrix::scaling(2, 2), "child scaled");

    sg::LoadResult kept = sg::fromJSON(
      R"({"type":"Group","transformContent":false,"matrix":[2,0,0,2,0,0],
          "children":[{"type":"Path","points":[[0,0],[1,1]]}]})");
    requireTrue(kept.ok, "kept ok");
    requireTrue(kept.node->matrix() == sg::Matrix::scaling(2, 2), "group keeps matrix");
    requireTrue(kept.node->firstChild()->matrix().isIdentity(), "child untouched");

    sg::LoadResult empty = sg::fromJSON(R"({"type":"Group","matrix":[1,0,0,1,3,4]})");
    requireTrue(empty.ok, "empty group ok");
    requireTrue(empty.node->matrix() == sg::Matrix::translation(3, 4), "empty group keeps matrix");
    std::string again = sg::toJSON(*empty.node);
    requireTrue(again.find("\"matrix\"") != std::string::npos, "matrix saved");
    std::printf("  Test 3 (matrices): PASS\n");
  }

  // ---- Test 4: Errors ----
  {
    sg::LoadResult bad = sg::fromJSON("{not json");
    requireTrue(!bad.ok && !bad.error.empty() && !bad.node, "parse error");

    sg::LoadResult noType = sg::fromJSON(R"({"name":"x"})");
    requireTrue(!noType.ok && noType.error.find("type") != std::string::npos, "missing type");

    sg::LoadResult unknown = sg::fromJSON(R"({"type":"Ellipse"})");
    requireTrue(!unknown.ok && unknown.error.find("Ellipse") != std::string::npos, "unknown type");

    sg::LoadResult color = sg::fromJSON(R"({"type":"Path","fillColor":"#zzz"})");
    requireTrue(!color.ok && color.error.find("color") != std::string::npos, "bad color");

    sg::LoadResult op = sg::fromJSON(R"({"type":"Group","compositing":"multiply"})");
    requireTrue(!op.ok && op.error.find("compositing") != std::string::npos, "bad operator");

    sg::LoadResult matrix = sg::fromJSON(R"({"type":"Path","matrix":[1,0,0]})");
    requireTrue(!matrix.ok && matrix.error.find("matrix") != std::string::npos, "bad matrix");

    sg::LoadResult nested = sg::fromJSON(
      R"({"type":"Group","children":[{"type":"Path"},{"type":"Path","points":[[1]]}]})");
    requireTrue(!nested.ok && nested.error.find("point") != std::string::npos, "nested failure");
    std::printf("  Test 4 (errors): PASS\n");
  }

  // ---- Test 5: Files ----
  {
    const std::string path = "s5_1_scene.json";
    auto scene = sampleScene();
    requireTrue(sg::saveSceneFile(path, *scene), "saved");
    sg::LoadResult r = sg::loadSceneFile(path);
    requireTrue(r.ok && r.node->childCount() == 4, "reloaded");
    std::remove(path.c_str());

    sg::LoadResult missing = sg::loadSceneFile("does_not_exist.json");
    requireTrue(!missing.ok && !missing.error.empty(), "missing file reported");
    std::printf("  Test 5 (files): PASS\n");
  }

  std::printf("S5.1 scene_json: ALL PASS\n");
  return 0;
}
