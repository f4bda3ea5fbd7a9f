#include "sg/scene/TextItem.hpp"
#include "sg/text/LineBreaker.hpp"

namespace sg {

TextItem::TextItem(const Point& point, const std::string& content)
  : content_(content), point_(point) {}

void TextItem::setContent(const std::string& content) {
  content_ = content;
  changed(Change::Content);
}

std::vector<std::string> TextItem::lines() const {
  if (content_.empty()) return {};
  return splitLogicalLines(content_);
}

void TextItem::setPoint(const Point& p) {
  point_ = p;
  changed(Change::Geometry);
}

void TextItem::setStyle(const CharacterStyle& style) {
  style_ = style;
  changed(Change::Style);
}

void TextItem::setFillColor(const std::optional<Color>& c) {
  style_.fillColor = c;
  changed(Change::Style);
}

void TextItem::setStrokeColor(const std::optional<Color>& c) {
  style_.strokeColor = c;
  changed(Change::Style);
}

void TextItem::setFontFamily(const std::string& family) {
  if (family.empty()) return;
  style_.fontFamily = family;
  changed(Change::Style);
}

void TextItem::setFontSize(float px) {
  style_.fontSize = px;
  changed(Change::Style);
}

void TextItem::setLeading(std::optional<float> leading) {
  style_.leading = leading;
  changed(Change::Style);
}

void TextItem::setJustification(Justification j) {
  style_.justification = j;
  changed(Change::Style);
}

Rect TextItem::localBounds() const {
  std::size_t n = lines().size();
  if (n == 0) return {point_.x, point_.y, 0, 0};
  double leading = style_.effectiveLeading();
  double top = point_.y - style_.fontSize;
  return {point_.x, top, 0, style_.fontSize + leading * static_cast<double>(n - 1)};
}

void TextItem::drawSelf(Surface& surface, RenderParams&) {
  std::vector<std::string> ls = lines();
  if (ls.empty()) return;

  if (style_.fillColor) surface.setFillColor(*style_.fillColor);
  if (style_.strokeColor) surface.setStrokeColor(*style_.strokeColor);
  surface.setLineWidth(style_.strokeWidth);
  surface.setFont(style_.font());
  surface.setTextAlign(style_.justification);

  double leading = style_.effectiveLeading();
  double y = point_.y;
  for (const auto& line : ls) {
    if (style_.fillColor) surface.fillText(line, point_.x, y);
    if (style_.strokeColor) surface.strokeText(line, point_.x, y);
    y += leading;
  }
}

std::unique_ptr<Node> TextItem::cloneSelf() const {
  auto t = std::make_unique<TextItem>(point_, content_);
  t->style_ = style_;
  return t;
}

} // namespace sg
