#include "sg/style/Style.hpp"

#include <cstdio>
#include <string>

namespace sg {

bool parseJustification(const std::string& s, Justification& out) {
  if (s == "left")   { out = Justification::Left;   return true; }
  if (s == "center") { out = Justification::Center; return true; }
  if (s == "right")  { out = Justification::Right;  return true; }
  return false;
}

std::string FontDescriptor::toCss() const {
  char size[32];
  std::snprintf(size, sizeof(size), "%gpx", static_cast<double>(sizePx));
  return weight + " " + size + " " + family;
}

// -------------------- Built-in presets --------------------

StyleDefaults shapeDefaults() {
  StyleDefaults d;
  d.fillColor.reset();
  d.strokeColor = Color::black();
  return d;
}

StyleDefaults textDefaults() {
  // Struct initializers already carry the text defaults.
  return StyleDefaults{};
}

// -------------------- Resolution --------------------

CharacterStyle resolveStyle(const StyleConfig& cfg, const StyleDefaults& defaults) {
  CharacterStyle s;

  s.fillColor = defaults.fillColor;
  if (cfg.noFill) s.fillColor.reset();
  else if (cfg.fillColor) s.fillColor = *cfg.fillColor;

  s.strokeColor = defaults.strokeColor;
  if (cfg.noStroke) s.strokeColor.reset();
  else if (cfg.strokeColor) s.strokeColor = *cfg.strokeColor;

  s.strokeWidth = cfg.strokeWidth ? *cfg.strokeWidth : defaults.strokeWidth;

  // An empty family never clears the default.
  s.fontFamily = (cfg.fontFamily && !cfg.fontFamily->empty()) ? *cfg.fontFamily
                                                             : defaults.fontFamily;
  s.fontWeight = (cfg.fontWeight && !cfg.fontWeight->empty()) ? *cfg.fontWeight
                                                             : defaults.fontWeight;
  s.fontSize = cfg.fontSize ? *cfg.fontSize : defaults.fontSize;

  // Zero leading counts as "not supplied".
  if (cfg.leading && *cfg.leading != 0.0f) s.leading = *cfg.leading;

  s.justification = cfg.justification ? *cfg.justification : defaults.justification;
  return s;
}

} // namespace sg
