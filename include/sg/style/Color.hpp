#pragma once
#include <string>

namespace sg {

// Straight (non-premultiplied) RGBA, each channel in [0..1].
struct Color {
  float r{0}, g{0}, b{0}, a{1};

  static Color rgb(float r, float g, float b) { return {r, g, b, 1.0f}; }
  static Color black() { return {0, 0, 0, 1}; }
  static Color white() { return {1, 1, 1, 1}; }
  static Color transparent() { return {0, 0, 0, 0}; }

  // CSS form: "#rrggbb" when opaque, "rgba(r,g,b,a)" otherwise.
  std::string toCss() const;
};

inline bool operator==(const Color& x, const Color& y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool operator!=(const Color& x, const Color& y) { return !(x == y); }

// Parses "#rgb", "#rrggbb", "#rrggbbaa", "rgb(r,g,b)", "rgba(r,g,b,a)" and a
// handful of named colors. Returns false (leaving `out` untouched) on failure.
bool parseCssColor(const std::string& text, Color& out);

} // namespace sg
