#pragma once
#include "sg/geom/Geometry.hpp"
#include "sg/style/Color.hpp"
#include "sg/style/Style.hpp"
#include "sg/surface/CompositeOp.hpp"

#include <string>
#include <vector>

namespace sg {

// Immediate-mode 2D drawing target. Mirrors the subset of a canvas context
// the scene graph needs. All state (transform, colors, font, alignment,
// composite operator) is part of the save()/restore() stack.
class Surface {
public:
  virtual ~Surface() = default;

  // State stack
  virtual void save() = 0;
  virtual void restore() = 0;

  // Coordinate transform (pre-multiplies the current matrix).
  virtual void translate(double dx, double dy) = 0;
  virtual void transform(const Matrix& m) = 0;
  virtual Matrix matrix() const = 0;

  // Paint state
  virtual void setFillColor(const Color& c) = 0;
  virtual void setStrokeColor(const Color& c) = 0;
  virtual void setLineWidth(double w) = 0;
  virtual CompositeOp compositeOp() const = 0;
  virtual void setCompositeOp(CompositeOp op) = 0;

  // Text state
  virtual void setFont(const FontDescriptor& font) = 0;
  virtual void setTextAlign(Justification align) = 0;

  // Width of `text` in user-space pixels under the current font.
  virtual double measureText(const std::string& text) = 0;
  virtual void fillText(const std::string& text, double x, double y) = 0;
  virtual void strokeText(const std::string& text, double x, double y) = 0;

  // Geometry
  virtual void fillPath(const std::vector<Point>& pts, bool closed) = 0;
  virtual void strokePath(const std::vector<Point>& pts, bool closed) = 0;

  // Offscreen layers. Drawing between beginLayer() and endLayer() lands on a
  // transparent layer, starting with source-over. endLayer() composites the
  // layer onto the previous target with the operator that was active at
  // beginLayer(). Back-ends without layer support draw directly.
  virtual void beginLayer() {}
  virtual void endLayer() {}
};

// Per-pass render parameters threaded through Node::draw.
struct RenderParams {
  // Floored top-left of a clipped group's stroke bounds; back-ends that
  // allocate temporary compositing layers align them to it.
  Point offset;
  bool hasOffset{false};
};

} // namespace sg
