#pragma once
#include "sg/style/Color.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sg {

enum class Justification : std::uint8_t {
  Left,
  Center,
  Right
};

inline const char* toString(Justification j) {
  switch (j) {
    case Justification::Left: return "left";
    case Justification::Center: return "center";
    case Justification::Right: return "right";
    default: return "unknown";
  }
}

bool parseJustification(const std::string& s, Justification& out);

struct FontDescriptor {
  std::string family{"sans-serif"};
  float sizePx{12.0f};
  std::string weight{"normal"};

  // e.g. "normal 12px sans-serif"
  std::string toCss() const;
};

// Fully resolved style carried by a drawable node.
struct CharacterStyle {
  std::optional<Color> fillColor;
  std::optional<Color> strokeColor;
  float strokeWidth{1.0f};

  std::string fontFamily{"sans-serif"};
  std::string fontWeight{"normal"};
  float fontSize{12.0f};
  std::optional<float> leading;   // unset -> fontSize * 1.2
  Justification justification{Justification::Left};

  float effectiveLeading() const { return leading ? *leading : fontSize * 1.2f; }
  FontDescriptor font() const { return {fontFamily, fontSize, fontWeight}; }
};

// Partial style input. Every field is independently optional; resolution
// merges present fields over StyleDefaults one by one.
struct StyleConfig {
  std::optional<Color> fillColor;
  bool noFill{false};
  std::optional<Color> strokeColor;
  bool noStroke{false};
  std::optional<float> strokeWidth;
  std::optional<std::string> fontFamily;
  std::optional<std::string> fontWeight;
  std::optional<float> fontSize;
  std::optional<float> leading;
  std::optional<Justification> justification;
};

struct StyleDefaults {
  std::optional<Color> fillColor{Color::black()};
  std::optional<Color> strokeColor;
  float strokeWidth{1.0f};
  std::string fontFamily{"sans-serif"};
  std::string fontWeight{"normal"};
  float fontSize{12.0f};
  Justification justification{Justification::Left};
};

// Defaults for plain shapes: no fill, black hairline stroke.
StyleDefaults shapeDefaults();
// Defaults for text: black fill, no stroke.
StyleDefaults textDefaults();

CharacterStyle resolveStyle(const StyleConfig& cfg, const StyleDefaults& defaults);

} // namespace sg
