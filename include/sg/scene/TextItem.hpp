#pragma once
#include "sg/scene/Node.hpp"
#include "sg/style/Style.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sg {

// Text payload: raw content plus character style, anchored at a point.
// Drawn standalone it renders as point text (one baseline per logical
// line, no wrapping); owned by an AreaText it is data only.
class TextItem : public Node {
public:
  TextItem() = default;
  explicit TextItem(const Point& point, const std::string& content = std::string());

  NodeKind kind() const override { return NodeKind::TextItem; }

  const std::string& content() const { return content_; }
  void setContent(const std::string& content);

  // Content split on "\r\n", "\n" or "\r".
  std::vector<std::string> lines() const;

  const Point& point() const { return point_; }
  void setPoint(const Point& p);

  const CharacterStyle& style() const { return style_; }
  void setStyle(const CharacterStyle& style);
  void setFillColor(const std::optional<Color>& c);
  void setStrokeColor(const std::optional<Color>& c);
  void setFontFamily(const std::string& family);
  void setFontSize(float px);
  void setLeading(std::optional<float> leading);
  void setJustification(Justification j);

  // Vertical extent only; widths need a surface to measure.
  Rect localBounds() const override;
  Rect localStrokeBounds() const override { return localBounds(); }

protected:
  void drawSelf(Surface& surface, RenderParams& params) override;
  std::unique_ptr<Node> cloneSelf() const override;

private:
  std::string content_;
  Point point_;
  CharacterStyle style_{resolveStyle(StyleConfig{}, textDefaults())};
};

} // namespace sg
