#include "sg/scene/Path.hpp"

namespace sg {

Path::Path(std::vector<Point> points, bool closed)
  : points_(std::move(points)), closed_(closed) {}

std::unique_ptr<Path> Path::rectangle(const Rect& r) {
  return std::make_unique<Path>(
    std::vector<Point>{{r.x, r.y}, {r.right(), r.y}, {r.right(), r.bottom()}, {r.x, r.bottom()}},
    true);
}

void Path::setPoints(std::vector<Point> points) {
  points_ = std::move(points);
  changed(Change::Geometry);
}

void Path::addPoint(const Point& p) {
  points_.push_back(p);
  changed(Change::Geometry);
}

void Path::setClosed(bool closed) {
  closed_ = closed;
  changed(Change::Geometry);
}

void Path::setFillColor(const std::optional<Color>& c) {
  style_.fillColor = c;
  changed(Change::Style);
}

void Path::setStrokeColor(const std::optional<Color>& c) {
  style_.strokeColor = c;
  changed(Change::Style);
}

void Path::setStrokeWidth(float w) {
  style_.strokeWidth = w;
  changed(Change::Style | Change::Geometry);
}

Rect Path::localBounds() const {
  return boundsOf(points_);
}

Rect Path::localStrokeBounds() const {
  Rect b = localBounds();
  if (!style_.strokeColor || style_.strokeWidth <= 0 || points_.empty()) return b;
  return b.expanded(style_.strokeWidth * 0.5);
}

void Path::applyStyles(Surface& surface) const {
  if (style_.fillColor) surface.setFillColor(*style_.fillColor);
  if (style_.strokeColor) surface.setStrokeColor(*style_.strokeColor);
  surface.setLineWidth(style_.strokeWidth);
}

void Path::drawSelf(Surface& surface, RenderParams&) {
  if (points_.empty()) return;
  applyStyles(surface);
  if (style_.fillColor) surface.fillPath(points_, closed_);
  if (style_.strokeColor && style_.strokeWidth > 0) surface.strokePath(points_, closed_);
}

void Path::copyPathInto(Path& dst) const {
  dst.points_ = points_;
  dst.closed_ = closed_;
  dst.style_ = style_;
}

std::unique_ptr<Node> Path::cloneSelf() const {
  auto p = std::make_unique<Path>();
  copyPathInto(*p);
  return p;
}

} // namespace sg
