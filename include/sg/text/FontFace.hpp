#pragma once
#include "sg/geom/Geometry.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

struct stbtt_fontinfo;

namespace sg {

using Contour = std::vector<Point>;

// A TrueType/OpenType face loaded through stb_truetype. Provides advance
// metrics and flattened glyph outlines; rasterization is the surface's job.
class FontFace {
public:
  FontFace();
  ~FontFace();

  FontFace(const FontFace&) = delete;
  FontFace& operator=(const FontFace&) = delete;

  // Load a TTF/OTF from memory.
  bool loadFont(const std::uint8_t* data, std::uint32_t len);

  // Load a TTF/OTF from file.
  bool loadFontFile(const std::string& path);

  bool isLoaded() const { return info_ != nullptr; }

  // Pixel scale for a CSS font size (em box maps to sizePx).
  double scaleForSize(double sizePx) const;

  // Horizontal advance of a UTF-8 run, kerning included.
  double advanceWidth(const std::string& utf8, double sizePx) const;

  // Outlines of a UTF-8 run with the pen starting at (0,0) on the baseline.
  // Pixel space, y grows downward.
  std::vector<Contour> textContours(const std::string& utf8, double sizePx) const;

  double ascent(double sizePx) const;
  double descent(double sizePx) const;

private:
  struct Glyph {
    int index{0};
    int advance{0};               // font units
    std::vector<Contour> contours; // font units, y up
  };

  const Glyph& glyphFor(std::uint32_t codepoint) const;

  std::vector<std::uint8_t> fontData_; // retained font file bytes
  std::unique_ptr<stbtt_fontinfo> info_;
  int ascent_{0}, descent_{0}, lineGap_{0};

  mutable std::unordered_map<std::uint32_t, Glyph> glyphs_;
};

// Family name -> face. Lookups of unknown families fall back to the default
// face (the first one registered unless set explicitly).
class FontRegistry {
public:
  // Takes ownership. Returns false if the face is not loaded.
  bool add(const std::string& family, std::unique_ptr<FontFace> face);

  // Convenience: load a file and register it under `family`.
  bool addFile(const std::string& family, const std::string& path);

  void setDefaultFamily(const std::string& family) { defaultFamily_ = family; }

  const FontFace* find(const std::string& family) const;
  bool empty() const { return faces_.empty(); }

private:
  std::unordered_map<std::string, std::unique_ptr<FontFace>> faces_;
  std::string defaultFamily_;
};

} // namespace sg
