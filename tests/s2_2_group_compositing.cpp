// S2.2 - Group draw order, clip cache and degenerate bounds
// Tests:
//   1. Non-clippable children are painted after every clip mask, in order
//   2. Without clip masks, non-clippable children paint in place
//   3. Clip masks paint with the group's operator; the operator is restored
//   4. clipItems() / isClipped() track flag changes and hierarchy changes
//   5. setClipped() toggles the first child; no-op on an empty group
//   6. Zero-area stroke bounds paint nothing (deferred children included)
//   7. params.offset is the floored top-left of the stroke bounds
//   8. Deferral is local to the group that owns the mask
//   9. An empty group paints nothing and leaves params alone

#include "RecordingSurface.hpp"
#include "sg/scene/Group.hpp"
#include "sg/scene/Path.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

// Filled 10x10 box whose x position identifies it in the call log.
static std::unique_ptr<sg::Path> box(double x) {
  auto p = sg::Path::rectangle({x, 0, 10, 10});
  p->setFillColor(sg::Color::black());
  p->setStrokeColor(std::nullopt);
  return p;
}

static std::unique_ptr<sg::Path> mask(double x) {
  auto p = box(x);
  p->setClipMask(true);
  return p;
}

static std::unique_ptr<sg::Path> pinned(double x) {
  auto p = box(x);
  p->setClippable(false);
  return p;
}

static std::vector<double> paintOrder(const sgtest::RecordingSurface& s) {
  std::vector<double> xs;
  for (const auto& c : s.callsOf("fillPath")) xs.push_back(c.at.x);
  return xs;
}

int main() {
  // ---- Test 1: Deferred non-clippable children ----
  {
    sg::Group g;
    g.addChild(box(0));
    g.addChild(mask(10));
    g.addChild(pinned(20));
    g.addChild(box(30));
    g.addChild(mask(40));
    g.addChild(pinned(50));

    sgtest::RecordingSurface s;
    sg::RenderParams params;
    g.draw(s, params);

    std::vector<double> expect = {0, 10, 30, 40, 20, 50};
    requireTrue(paintOrder(s) == expect, "pinned children after all masks, in order");
    requireTrue(s.layersOpened == 1 && s.layersClosed == 1, "clipped group is layered");
    requireTrue(s.saveDepth == 0, "balanced");
    std::printf("  Test 1 (deferred order): PASS\n");
  }

  // ---- Test 2: No masks, no deferral ----
  {
    sg::Group g;
    g.addChild(box(0));
    g.addChild(pinned(10));
    g.addChild(box(20));

    sgtest::RecordingSurface s;
    sg::RenderParams params;
    g.draw(s, params);
    std::vector<double> expect = {0, 10, 20};
    requireTrue(paintOrder(s) == expect, "document order");
    requireTrue(s.layersOpened == 0, "unclipped group not layered");
    requireTrue(!params.hasOffset, "offset untouched");
    std::printf("  Test 2 (no masks): PASS\n");
  }

  // ---- Test 3: Operators ----
  {
    sg::Group g;
    g.addChild(box(0));
    g.addChild(mask(10));
    g.addChild(box(20));

    sgtest::RecordingSurface s;
    sg::RenderParams params;
    g.draw(s, params);
    auto calls = s.callsOf("fillPath");
    requireTrue(calls.size() == 3, "3 paints");
    requireTrue(calls[0].composite == sg::CompositeOp::SourceOver, "content source-over");
    requireTrue(calls[1].composite == sg::CompositeOp::SourceIn, "mask source-in");
    requireTrue(calls[2].composite == sg::CompositeOp::SourceOver, "operator restored");

    g.setCompositing(sg::CompositeOp::DestinationOut);
    sgtest::RecordingSurface s2;
    g.draw(s2, params);
    requireTrue(s2.callsOf("fillPath")[1].composite == sg::CompositeOp::DestinationOut,
                "custom compositing used for mask");
    requireTrue(s2.compositeOp() == sg::CompositeOp::SourceOver, "surface op restored");
    std::printf("  Test 3 (operators): PASS\n");
  }

  // ---- Test 4: Clip cache ----
  {
    sg::Group g;
    sg::Node* a = g.addChild(box(0));
    sg::Node* b = g.addChild(box(10));
    requireTrue(!g.isClipped(), "initially unclipped");
    requireTrue(g.clipItems().empty(), "no clip items");

    b->setClipMask(true);
    requireTrue(g.isClipped(), "flag on child clips group");
    requireTrue(g.clipItems().size() == 1 && g.clipItems()[0] == b, "clip item is b");

    a->setClipMask(true);
    requireTrue(g.clipItems().size() == 2 && g.clipItems()[0] == a, "list order kept");

    b->setClipMask(false);
    a->setClipMask(false);
    requireTrue(!g.isClipped(), "clearing flags unclips");

    sg::Node* m = g.addChild(mask(20));
    requireTrue(g.isClipped(), "adding a mask clips");
    std::unique_ptr<sg::Node> gone = m->remove();
    requireTrue(!g.isClipped(), "removing the mask unclips");

    // A clip mask nested one level down does not clip this group.
    auto inner = std::make_unique<sg::Group>();
    inner->addChild(mask(30));
    g.addChild(std::move(inner));
    requireTrue(!g.isClipped(), "only direct children count");
    std::printf("  Test 4 (clip cache): PASS\n");
  }

  // ---- Test 5: setClipped ----
  {
    sg::Group empty;
    empty.setClipped(true);
    requireTrue(!empty.isClipped(), "empty group stays unclipped");

    sg::Group g;
    sg::Node* first = g.addChild(box(0));
    g.addChild(box(10));
    g.setClipped(true);
    requireTrue(first->isClipMask(), "first child flagged");
    requireTrue(g.isClipped(), "group clipped");
    g.setClipped(false);
    requireTrue(!first->isClipMask() && !g.isClipped(), "cleared");
    std::printf("  Test 5 (setClipped): PASS\n");
  }

  // ---- Test 6: Degenerate bounds ----
  {
    sg::Group g;
    auto line = std::make_unique<sg::Path>(std::vector<sg::Point>{{5, 0}, {5, 10}}, false);
    line->setFillColor(sg::Color::black());
    line->setStrokeColor(std::nullopt);
    line->setClipMask(true);
    g.addChild(std::move(line));
    auto flat = std::make_unique<sg::Path>(std::vector<sg::Point>{{5, 2}, {5, 8}}, false);
    flat->setFillColor(sg::Color::black());
    flat->setStrokeColor(std::nullopt);
    flat->setClippable(false);
    g.addChild(std::move(flat));

    requireTrue(g.strokeBounds().width == 0, "zero-width stroke bounds");
    sgtest::RecordingSurface s;
    sg::RenderParams params;
    g.draw(s, params);
    requireTrue(s.calls.empty(), "nothing painted");
    requireTrue(!params.hasOffset, "offset not set");
    requireTrue(s.saveDepth == 0, "balanced after early return");
    std::printf("  Test 6 (degenerate): PASS\n");
  }

  // ---- Test 7: Offset ----
  {
    sg::Group g;
    auto framed = sg::Path::rectangle({2.5, 3.7, 10, 10});
    framed->setStrokeColor(sg::Color::black());
    framed->setStrokeWidth(2);
    g.addChild(std::move(framed));
    auto inside = sg::Path::rectangle({5, 5, 2, 2});
    inside->setFillColor(sg::Color::black());
    inside->setClipMask(true);
    g.addChild(std::move(inside));

    sgtest::RecordingSurface s;
    sg::RenderParams params;
    g.draw(s, params);
    requireTrue(params.hasOffset, "offset set");
    requireTrue(params.offset == (sg::Point{1, 2}), "floored stroke top-left");
    std::printf("  Test 7 (offset): PASS\n");
  }

  // ---- Test 8: Nested groups ----
  {
    sg::Group outer;
    auto inner = std::make_unique<sg::Group>();
    inner->addChild(box(0));
    inner->addChild(mask(10));
    inner->addChild(pinned(20));
    inner->addChild(box(30));
    outer.addChild(std::move(inner));
    outer.addChild(pinned(40));
    outer.addChild(box(50));

    sgtest::RecordingSurface s;
    sg::RenderParams params;
    outer.draw(s, params);
    std::vector<double> expect = {0, 10, 30, 20, 40, 50};
    requireTrue(paintOrder(s) == expect, "inner group defers locally only");
    requireTrue(!outer.isClipped(), "outer unclipped");
    std::printf("  Test 8 (nested): PASS\n");
  }

  // ---- Test 9: Empty group ----
  {
    sg::Group g;
    requireTrue(!g.isClipped() && g.clipItems().empty(), "no clip items");
    sgtest::RecordingSurface s;
    sg::RenderParams params;
    g.draw(s, params);
    requireTrue(s.calls.empty(), "nothing painted");
    requireTrue(!params.hasOffset, "offset not set");
    requireTrue(s.saveDepth == 0, "balanced");
    requireTrue(s.layersOpened == 0, "no layer");
    std::printf("  Test 9 (empty group): PASS\n");
  }

  std::printf("S2.2 group_compositing: ALL PASS\n");
  return 0;
}
