#include "sg/scene/AreaText.hpp"
#include "sg/text/LineBreaker.hpp"

#include <cstdio>

namespace sg {

namespace {

// Writes wrapped lines top-down from the current origin.
class LineWriter {
public:
  LineWriter(Surface& surface, const CharacterStyle& style, double maxHeight)
    : surface_(surface), leading_(style.effectiveLeading()), maxHeight_(maxHeight),
      fill_(style.fillColor.has_value()), stroke_(style.strokeColor.has_value()) {}

  void write(const std::string& line) {
    if (currentHeight_ + leading_ > maxHeight_) return;

    if (fill_) surface_.fillText(line, 0, 0);
    if (stroke_) surface_.strokeText(line, 0, 0);
    surface_.translate(0, leading_);
    currentHeight_ += leading_;
  }

private:
  Surface& surface_;
  double leading_;
  double maxHeight_;
  bool fill_;
  bool stroke_;
  double currentHeight_{0};
};

} // namespace

AreaText::AreaText() {
  style_ = resolveStyle(StyleConfig{}, textDefaults());
  setColorStyle(style_.fillColor, style_.strokeColor);
}

AreaText::AreaText(std::vector<Point> outline, bool createText)
  : Path(std::move(outline), true) {
  style_ = resolveStyle(StyleConfig{}, textDefaults());
  setColorStyle(style_.fillColor, style_.strokeColor);
  if (createText) setText();
}

AreaText::AreaText(const AreaTextConfig& cfg)
  : Path(cfg.outline.empty()
           ? std::vector<Point>{{cfg.frame.x, cfg.frame.y},
                                {cfg.frame.right(), cfg.frame.y},
                                {cfg.frame.right(), cfg.frame.bottom()},
                                {cfg.frame.x, cfg.frame.bottom()}}
           : cfg.outline,
         true) {
  style_ = resolveStyle(cfg.style, textDefaults());

  if (cfg.content) {
    setText(std::make_unique<TextItem>(localBounds().topLeft(), *cfg.content));
  } else if (cfg.createText) {
    setText();
  }

  setColorStyle(style_.fillColor, style_.strokeColor);
  setFontStyle(style_.fontSize, style_.leading, style_.fontFamily);
}

void AreaText::setText(std::unique_ptr<TextItem> text) {
  text_ = text ? std::move(text) : std::make_unique<TextItem>(localBounds().topLeft());
  syncPayloadStyle();
  changed(Change::Content);
}

bool AreaText::adoptText(TextItem& attached) {
  std::unique_ptr<Node> owned = attached.remove();
  if (!owned) return false;
  setText(std::unique_ptr<TextItem>(static_cast<TextItem*>(owned.release())));
  return true;
}

void AreaText::setColorStyle(const std::optional<Color>& fill,
                             const std::optional<Color>& stroke) {
  style_.fillColor = fill;
  style_.strokeColor = stroke;
  cssFillColor_ = fill;
  cssStrokeColor_ = stroke;
  syncPayloadStyle();
  changed(Change::Style);
}

void AreaText::setFillColor(const std::optional<Color>& c) {
  setColorStyle(c, style_.strokeColor);
}

void AreaText::setStrokeColor(const std::optional<Color>& c) {
  setColorStyle(style_.fillColor, c);
}

void AreaText::setFontStyle(float fontSize, std::optional<float> leading,
                            const std::string& fontFamily) {
  style_.fontSize = fontSize;
  if (leading && *leading != 0.0f) style_.leading = *leading;
  else style_.leading = fontSize * 1.2f;
  if (!fontFamily.empty()) style_.fontFamily = fontFamily;
  syncPayloadStyle();
  changed(Change::Style);
}

void AreaText::setJustification(Justification j) {
  style_.justification = j;
  syncPayloadStyle();
  changed(Change::Style);
}

std::string AreaText::fontSizeCss() const {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%gpx", static_cast<double>(style_.fontSize));
  return buf;
}

void AreaText::syncPayloadStyle() {
  if (text_) text_->setStyle(style_);
}

void AreaText::drawSelf(Surface& surface, RenderParams&) {
  if (!text_ || text_->content().empty()) return;
  applyStyles(surface);

  const Rect frame = localBounds();
  const double maxWidth = frame.width;
  const double maxHeight = frame.height;
  if (maxWidth == 0 || maxHeight == 0) return;

  surface.setFont(style_.font());
  surface.setTextAlign(style_.justification);
  // First baseline sits fontSize - 1 below the top edge.
  surface.translate(frame.x + 1, frame.y + static_cast<int>(style_.fontSize) - 1);

  MeasureFn measure = [&surface](const std::string& run) { return surface.measureText(run); };
  LineWriter writer(surface, style_, maxHeight);
  for (const auto& line : wrapText(text_->content(), measure, maxWidth)) {
    writer.write(line);
  }
}

std::unique_ptr<Node> AreaText::cloneSelf() const {
  auto copy = std::make_unique<AreaText>();
  copyPathInto(*copy);
  if (text_) copy->text_ = cloneAs(*text_);
  copy->cssFillColor_ = cssFillColor_;
  copy->cssStrokeColor_ = cssStrokeColor_;
  return copy;
}

} // namespace sg
