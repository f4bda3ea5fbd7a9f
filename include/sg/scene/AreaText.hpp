#pragma once
#include "sg/scene/Path.hpp"
#include "sg/scene/TextItem.hpp"
#include "sg/style/Style.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sg {

struct AreaTextConfig {
  // Closed outline; when empty, `frame` is used as a rectangle.
  std::vector<Point> outline;
  Rect frame;

  StyleConfig style;

  // Initial content. When unset, an empty payload is still created if
  // createText is true.
  std::optional<std::string> content;
  bool createText{true};
};

// Text confined to the bounding box of a closed path.
//
// Each draw re-wraps the payload's content to the box width (greedy, by
// words, then by characters for words wider than the box) and writes lines
// top-down. A line that would cross the bottom edge is dropped, and since
// the cursor no longer advances every later line is dropped too.
//
// Drawing uses this node's style. The payload's style is kept in sync by
// the style setters; the payload itself is never part of the scene graph.
class AreaText : public Path {
public:
  AreaText();
  explicit AreaText(std::vector<Point> outline, bool createText = false);
  explicit AreaText(const AreaTextConfig& cfg);

  NodeKind kind() const override { return NodeKind::AreaText; }

  // Take ownership of `text` as the payload. nullptr creates an empty
  // payload anchored at the frame's top-left corner.
  void setText(std::unique_ptr<TextItem> text = nullptr);

  // Detach a TextItem that currently lives in the scene graph and make it
  // the payload. Returns false if it had no parent.
  bool adoptText(TextItem& attached);

  TextItem* text() const { return text_.get(); }

  // Single write path for colors: canonical style and cached mirrors are
  // updated together.
  void setColorStyle(const std::optional<Color>& fill, const std::optional<Color>& stroke);
  void setFillColor(const std::optional<Color>& c) override;
  void setStrokeColor(const std::optional<Color>& c) override;

  // Leading falls back to fontSize * 1.2 when unset or zero. An empty family
  // keeps the current one.
  void setFontStyle(float fontSize, std::optional<float> leading, const std::string& fontFamily);

  void setJustification(Justification j);

  const std::optional<Color>& cssFillColor() const { return cssFillColor_; }
  const std::optional<Color>& cssStrokeColor() const { return cssStrokeColor_; }

  float fontSize() const { return style_.fontSize; }
  std::string fontSizeCss() const;
  float leading() const { return style_.effectiveLeading(); }
  const std::string& fontFamily() const { return style_.fontFamily; }
  Justification justification() const { return style_.justification; }

protected:
  void drawSelf(Surface& surface, RenderParams& params) override;
  std::unique_ptr<Node> cloneSelf() const override;

private:
  void syncPayloadStyle();

  std::unique_ptr<TextItem> text_;
  std::optional<Color> cssFillColor_;
  std::optional<Color> cssStrokeColor_;
};

} // namespace sg
