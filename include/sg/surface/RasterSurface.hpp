#pragma once
#include "sg/surface/Surface.hpp"
#include "sg/text/FontFace.hpp"

#include <cstdint>
#include <vector>

namespace sg {

// Software Surface over a premultiplied RGBA float buffer.
//
// Shapes and glyph outlines go through one anti-aliased scanline rasterizer
// (nonzero winding, 4 sub-scanlines per row) and are blended with the active
// CompositeOp. Text requires a FontRegistry; without one measureText()
// returns 0 and text paints nothing.
class RasterSurface : public Surface {
public:
  RasterSurface(int width, int height);

  int width() const { return w_; }
  int height() const { return h_; }

  void setFontRegistry(const FontRegistry* fonts) { fonts_ = fonts; }

  // Fill the whole target (ignores transform and composite op).
  void clear(const Color& c = Color::transparent());

  // Unpremultiplied color at a device pixel; transparent when out of range.
  Color pixel(int x, int y) const;

  // Unpremultiplied 8-bit RGBA, rows top-down.
  std::vector<std::uint8_t> toRGBA8() const;

  std::size_t layerDepth() const { return layers_.size(); }

  // Surface
  void save() override;
  void restore() override;
  void translate(double dx, double dy) override;
  void transform(const Matrix& m) override;
  Matrix matrix() const override { return state_.matrix; }

  void setFillColor(const Color& c) override { state_.fill = c; }
  void setStrokeColor(const Color& c) override { state_.stroke = c; }
  void setLineWidth(double w) override { state_.lineWidth = w; }
  CompositeOp compositeOp() const override { return state_.op; }
  void setCompositeOp(CompositeOp op) override { state_.op = op; }

  void setFont(const FontDescriptor& font) override { state_.font = font; }
  void setTextAlign(Justification align) override { state_.align = align; }

  double measureText(const std::string& text) override;
  void fillText(const std::string& text, double x, double y) override;
  void strokeText(const std::string& text, double x, double y) override;

  void fillPath(const std::vector<Point>& pts, bool closed) override;
  void strokePath(const std::vector<Point>& pts, bool closed) override;

  void beginLayer() override;
  void endLayer() override;

private:
  struct State {
    Matrix matrix;
    Color fill{Color::black()};
    Color stroke{Color::black()};
    double lineWidth{1.0};
    CompositeOp op{CompositeOp::SourceOver};
    FontDescriptor font;
    Justification align{Justification::Left};
  };

  struct Premul {
    float r{0}, g{0}, b{0}, a{0};
  };

  using Pixels = std::vector<Premul>;

  // Target saved by beginLayer() and the operator the layer is merged with.
  struct Layer {
    Pixels below;
    CompositeOp op;
  };

  // Porter-Duff blend of premultiplied `f` over backdrop `b` for op bits.
  static Premul blend(int bits, const Premul& f, const Premul& b);

  // Device-space polygons -> per-pixel coverage in [0..1].
  void rasterize(const std::vector<Contour>& device, std::vector<float>& coverage) const;

  // Blend `color` weighted by `coverage` into the current target.
  void composite(const std::vector<float>& coverage, const Color& color, CompositeOp op);

  // User-space stroke outline: one quad per segment plus joins.
  std::vector<Contour> strokeOutline(const Contour& pts, bool closed, double width) const;

  std::vector<Contour> toDevice(const std::vector<Contour>& user) const;

  const FontFace* currentFace();
  double alignOffset(const std::string& text, const FontFace& face) const;

  int w_, h_;
  Pixels px_;
  std::vector<Layer> layers_;
  State state_;
  std::vector<State> stack_;
  const FontRegistry* fonts_{nullptr};
  bool warnedNoFont_{false};
};

} // namespace sg
