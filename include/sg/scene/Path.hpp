#pragma once
#include "sg/scene/Node.hpp"
#include "sg/style/Style.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace sg {

// Polyline shape with optional fill and stroke.
class Path : public Node {
public:
  Path() = default;
  explicit Path(std::vector<Point> points, bool closed = false);

  // Closed clockwise rectangle starting at the top-left corner.
  static std::unique_ptr<Path> rectangle(const Rect& r);

  NodeKind kind() const override { return NodeKind::Path; }

  const std::vector<Point>& points() const { return points_; }
  void setPoints(std::vector<Point> points);
  void addPoint(const Point& p);
  bool isClosed() const { return closed_; }
  void setClosed(bool closed);

  const CharacterStyle& style() const { return style_; }

  const std::optional<Color>& fillColor() const { return style_.fillColor; }
  const std::optional<Color>& strokeColor() const { return style_.strokeColor; }
  float strokeWidth() const { return style_.strokeWidth; }
  virtual void setFillColor(const std::optional<Color>& c);
  virtual void setStrokeColor(const std::optional<Color>& c);
  void setStrokeWidth(float w);

  Rect localBounds() const override;
  Rect localStrokeBounds() const override;

protected:
  void drawSelf(Surface& surface, RenderParams& params) override;
  std::unique_ptr<Node> cloneSelf() const override;

  // Push fill/stroke/line width into the surface.
  void applyStyles(Surface& surface) const;

  // Copies path fields (points, closed, style) into `dst`.
  void copyPathInto(Path& dst) const;

  CharacterStyle style_{resolveStyle(StyleConfig{}, shapeDefaults())};

private:
  std::vector<Point> points_;
  bool closed_{false};
};

} // namespace sg
