// S4.1 - RasterSurface: coverage, compositing operators, layers
// Tests:
//   1. source-over fill: solid interior, transparent outside, partial edge
//   2. source-in keeps the new color only where content existed, clears the rest
//   3. destination-out erases; destination-over paints underneath
//   4. Layers composite back source-over and scope unbounded operators
//   5. Stroke coverage and save/restore of the transform
//   6. Clipped group end to end: mask, cleared outside, pinned child survives
//   7. toRGBA8 unpremultiplies; clear() fills the target
//   8. A clipped group used as a clip mask masks its parent's content
//   9. Coordinates far outside the int range are clamped, not converted

#include "sg/scene/Group.hpp"
#include "sg/scene/Path.hpp"
#include "sg/surface/RasterSurface.hpp"

#include <cmath>
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

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %f, expected %f)\n", msg, a, b);
    std::exit(1);
  }
}

static bool sameColor(const sg::Color& a, const sg::Color& b) {
  const float eps = 1e-4f;
  return std::fabs(a.r - b.r) < eps && std::fabs(a.g - b.g) < eps &&
         std::fabs(a.b - b.b) < eps && std::fabs(a.a - b.a) < eps;
}

static std::vector<sg::Point> rect(double x, double y, double w, double h) {
  return {{x, y}, {x + w, y}, {x + w, y + h}, {x, y + h}};
}

static std::unique_ptr<sg::Path> filled(const sg::Rect& r, const sg::Color& c) {
  auto p = sg::Path::rectangle(r);
  p->setFillColor(c);
  p->setStrokeColor(std::nullopt);
  return p;
}

int main() {
  const sg::Color red = sg::Color::rgb(1, 0, 0);
  const sg::Color green = sg::Color::rgb(0, 1, 0);
  const sg::Color blue = sg::Color::rgb(0, 0, 1);

  // ---- Test 1: source-over ----
  {
    sg::RasterSurface s(20, 20);
    s.setFillColor(red);
    s.fillPath(rect(0.5, 0, 10, 10), true);
    requireTrue(sameColor(s.pixel(5, 5), red), "interior solid");
    requireTrue(s.pixel(15, 5).a == 0.0f, "outside transparent");
    requireNear(s.pixel(0, 5).a, 0.5, 1e-4, "half-covered edge pixel");
    requireNear(s.pixel(0, 5).r, 1.0, 1e-4, "edge keeps color");
    requireTrue(s.pixel(-1, 0).a == 0.0f && s.pixel(20, 0).a == 0.0f, "out of range");
    std::printf("  Test 1 (source-over): PASS\n");
  }

  // ---- Test 2: source-in ----
  {
    sg::RasterSurface s(20, 10);
    s.setFillColor(red);
    s.fillPath(rect(0, 0, 10, 10), true);
    s.setCompositeOp(sg::CompositeOp::SourceIn);
    s.setFillColor(blue);
    s.fillPath(rect(5, 0, 10, 10), true);
    requireTrue(s.pixel(2, 5).a == 0.0f, "content outside the mask cleared");
    requireTrue(sameColor(s.pixel(7, 5), blue), "overlap takes the mask color");
    requireTrue(s.pixel(12, 5).a == 0.0f, "mask outside content stays empty");
    std::printf("  Test 2 (source-in): PASS\n");
  }

  // ---- Test 3: destination-out / destination-over ----
  {
    sg::RasterSurface s(20, 10);
    s.setFillColor(red);
    s.fillPath(rect(0, 0, 20, 10), true);
    s.setCompositeOp(sg::CompositeOp::DestinationOut);
    s.fillPath(rect(5, 0, 5, 10), true);
    requireTrue(s.pixel(7, 5).a == 0.0f, "erased");
    requireTrue(sameColor(s.pixel(2, 5), red), "outside the eraser kept");

    s.setCompositeOp(sg::CompositeOp::DestinationOver);
    s.setFillColor(blue);
    s.fillPath(rect(0, 0, 20, 10), true);
    requireTrue(sameColor(s.pixel(2, 5), red), "existing content stays on top");
    requireTrue(sameColor(s.pixel(7, 5), blue), "hole filled from below");
    std::printf("  Test 3 (destination ops): PASS\n");
  }

  // ---- Test 4: Layers ----
  {
    sg::RasterSurface s(20, 10);
    s.clear(sg::Color::white());
    s.beginLayer();
    requireTrue(s.layerDepth() == 1, "layer open");
    s.setFillColor(red);
    s.fillPath(rect(0, 0, 10, 10), true);
    s.setCompositeOp(sg::CompositeOp::SourceIn);
    s.setFillColor(blue);
    s.fillPath(rect(5, 0, 10, 10), true);
    s.endLayer();
    requireTrue(s.layerDepth() == 0, "layer closed");
    requireTrue(sameColor(s.pixel(2, 5), sg::Color::white()), "backdrop untouched by source-in");
    requireTrue(sameColor(s.pixel(7, 5), blue), "layer result composited");
    requireTrue(sameColor(s.pixel(17, 5), sg::Color::white()), "backdrop outside");

    s.endLayer();
    requireTrue(s.layerDepth() == 0, "unbalanced endLayer ignored");
    std::printf("  Test 4 (layers): PASS\n");
  }

  // ---- Test 5: Stroke and transform ----
  {
    sg::RasterSurface s(30, 10);
    s.setStrokeColor(green);
    s.setLineWidth(2);
    s.strokePath({{0, 5}, {20, 5}}, false);
    requireNear(s.pixel(10, 4).a, 1.0, 1e-4, "row above center covered");
    requireNear(s.pixel(10, 5).a, 1.0, 1e-4, "row below center covered");
    requireTrue(s.pixel(10, 7).a == 0.0f, "outside stroke width");
    requireTrue(s.pixel(25, 5).a == 0.0f, "past the end");

    sg::RasterSurface t(30, 10);
    t.save();
    t.translate(20, 0);
    t.setFillColor(red);
    t.fillPath(rect(0, 0, 5, 5), true);
    t.restore();
    requireTrue(sameColor(t.pixel(22, 2), red), "translated fill");
    requireTrue(t.pixel(2, 2).a == 0.0f, "origin untouched");
    requireTrue(t.matrix().isIdentity(), "restore resets matrix");
    requireTrue(t.compositeOp() == sg::CompositeOp::SourceOver, "default operator");
    std::printf("  Test 5 (stroke/transform): PASS\n");
  }

  // ---- Test 6: Clipped group ----
  {
    sg::Group g;
    g.addChild(filled({0, 0, 20, 20}, red));
    g.addChild(filled({5, 5, 10, 10}, blue))->setClipMask(true);
    g.addChild(filled({15, 15, 10, 10}, green))->setClippable(false);

    sg::RasterSurface s(30, 30);
    s.clear(sg::Color::white());
    sg::RenderParams params;
    g.draw(s, params);

    requireTrue(sameColor(s.pixel(2, 2), sg::Color::white()), "content outside mask removed");
    requireTrue(sameColor(s.pixel(7, 7), blue), "masked region");
    requireTrue(sameColor(s.pixel(17, 17), green), "pinned child painted over the mask");
    requireTrue(sameColor(s.pixel(22, 22), green), "pinned child outside the mask kept");
    requireTrue(sameColor(s.pixel(27, 27), sg::Color::white()), "untouched background");
    requireTrue(s.layerDepth() == 0, "layer closed");

    // Without the mask the same children paint in order.
    g.childAt(1)->setClipMask(false);
    sg::RasterSurface u(30, 30);
    g.draw(u, params);
    requireTrue(sameColor(u.pixel(2, 2), red), "unclipped content");
    std::printf("  Test 6 (clipped group): PASS\n");
  }

  // ---- Test 7: Export pixels ----
  {
    sg::RasterSurface s(2, 1);
    s.clear(sg::Color{0, 0, 1, 0.5f});
    std::vector<std::uint8_t> px = s.toRGBA8();
    requireTrue(px.size() == 8, "2 pixels");
    requireTrue(px[0] == 0 && px[1] == 0 && px[2] == 255, "unpremultiplied color");
    requireTrue(px[3] == 128, "alpha");
    std::printf("  Test 7 (export pixels): PASS\n");
  }

  // ---- Test 8: Clipped group as a mask ----
  {
    auto makeOuter = [&](std::unique_ptr<sg::Node> mask) {
      auto outer = std::make_unique<sg::Group>();
      outer->addChild(filled({0, 0, 20, 20}, red));
      outer->addChild(std::move(mask))->setClipMask(true);
      return outer;
    };

    // Reference: a plain path mask.
    auto plain = makeOuter(filled({0, 0, 5, 5}, blue));
    sg::RasterSurface ref(20, 20);
    sg::RenderParams params;
    plain->draw(ref, params);
    requireTrue(ref.pixel(15, 15).a == 0.0f, "path mask clears outside");

    // Same shape, drawn by a clipped inner group.
    auto inner = std::make_unique<sg::Group>();
    inner->addChild(filled({0, 0, 5, 5}, blue));
    inner->addChild(filled({0, 0, 5, 5}, blue))->setClipMask(true);
    requireTrue(inner->isClipped(), "inner group clipped");
    auto nested = makeOuter(std::move(inner));

    sg::RasterSurface s(20, 20);
    nested->draw(s, params);
    requireTrue(s.pixel(15, 15).a == 0.0f, "group mask clears outside");
    requireTrue(sameColor(s.pixel(2, 2), blue), "group mask paints its content");
    requireTrue(sameColor(s.pixel(2, 2), ref.pixel(2, 2)), "matches the path mask");
    requireTrue(s.layerDepth() == 0, "layers closed");

    // The operator in effect at beginLayer() applies; the layer starts at source-over.
    sg::RasterSurface t(20, 10);
    t.setFillColor(red);
    t.fillPath(rect(0, 0, 10, 10), true);
    t.setCompositeOp(sg::CompositeOp::DestinationOut);
    t.beginLayer();
    requireTrue(t.compositeOp() == sg::CompositeOp::SourceOver, "layer starts source-over");
    t.setFillColor(blue);
    t.fillPath(rect(5, 0, 10, 10), true);
    t.endLayer();
    requireTrue(sameColor(t.pixel(2, 5), red), "outside the layer kept");
    requireTrue(t.pixel(7, 5).a == 0.0f, "layer erased the target");
    std::printf("  Test 8 (group mask): PASS\n");
  }

  // ---- Test 9: Huge coordinates ----
  {
    sg::RasterSurface s(20, 20);
    s.setFillColor(red);
    s.fillPath({{-1e20, -1e20}, {1e20, -1e20}, {1e20, 1e20}, {-1e20, 1e20}}, true);
    requireTrue(sameColor(s.pixel(5, 5), red), "surface-covering fill");
    requireTrue(sameColor(s.pixel(19, 19), red), "last pixel covered");

    sg::RasterSurface t(20, 20);
    t.setFillColor(red);
    t.fillPath(rect(0, 1e12, 10, 10), true);
    t.fillPath(rect(-1e12, 0, 10, 10), true);
    requireTrue(t.pixel(5, 5).a == 0.0f, "far-off shapes paint nothing");

    sg::RasterSurface u(20, 20);
    u.save();
    u.transform(sg::Matrix{1e15, 0, 0, 1e15, 0, 0});
    u.setFillColor(green);
    u.fillPath(rect(-1, -1, 2, 2), true);
    u.restore();
    requireTrue(sameColor(u.pixel(10, 10), green), "huge transform covers the surface");
    std::printf("  Test 9 (huge coordinates): PASS\n");
  }

  std::printf("S4.1 raster_surface: ALL PASS\n");
  return 0;
}
