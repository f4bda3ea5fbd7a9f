#include "sg/text/FontFace.hpp"
#include "sg/text/Utf8.hpp"

#include <cstdio>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace sg {

namespace {

// Segments per curve when flattening outlines.
constexpr int kCurveSteps = 8;

void flattenQuad(Contour& out, Point p0, Point c, Point p1) {
  for (int i = 1; i <= kCurveSteps; i++) {
    double t = static_cast<double>(i) / kCurveSteps;
    double u = 1.0 - t;
    out.push_back({u * u * p0.x + 2 * u * t * c.x + t * t * p1.x,
                   u * u * p0.y + 2 * u * t * c.y + t * t * p1.y});
  }
}

void flattenCubic(Contour& out, Point p0, Point c0, Point c1, Point p1) {
  for (int i = 1; i <= kCurveSteps; i++) {
    double t = static_cast<double>(i) / kCurveSteps;
    double u = 1.0 - t;
    double w0 = u * u * u, w1 = 3 * u * u * t, w2 = 3 * u * t * t, w3 = t * t * t;
    out.push_back({w0 * p0.x + w1 * c0.x + w2 * c1.x + w3 * p1.x,
                   w0 * p0.y + w1 * c0.y + w2 * c1.y + w3 * p1.y});
  }
}

} // namespace

FontFace::FontFace() = default;
FontFace::~FontFace() = default;

bool FontFace::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0) return false;
  fontData_.assign(data, data + len);

  auto info = std::make_unique<stbtt_fontinfo>();
  int offset = stbtt_GetFontOffsetForIndex(fontData_.data(), 0);
  if (offset < 0 || !stbtt_InitFont(info.get(), fontData_.data(), offset)) {
    std::fprintf(stderr, "FontFace: stbtt_InitFont failed\n");
    fontData_.clear();
    info_.reset();
    return false;
  }

  stbtt_GetFontVMetrics(info.get(), &ascent_, &descent_, &lineGap_);
  info_ = std::move(info);
  glyphs_.clear();
  return true;
}

bool FontFace::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "FontFace: cannot open %s\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) return false;
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) return false;
  return loadFont(bytes.data(), static_cast<std::uint32_t>(bytes.size()));
}

double FontFace::scaleForSize(double sizePx) const {
  if (!info_) return 0.0;
  return stbtt_ScaleForMappingEmToPixels(info_.get(), static_cast<float>(sizePx));
}

double FontFace::ascent(double sizePx) const {
  return ascent_ * scaleForSize(sizePx);
}

double FontFace::descent(double sizePx) const {
  return -descent_ * scaleForSize(sizePx);
}

const FontFace::Glyph& FontFace::glyphFor(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  if (it != glyphs_.end()) return it->second;

  Glyph g;
  g.index = stbtt_FindGlyphIndex(info_.get(), static_cast<int>(codepoint));
  int lsb = 0;
  stbtt_GetGlyphHMetrics(info_.get(), g.index, &g.advance, &lsb);

  stbtt_vertex* verts = nullptr;
  int n = stbtt_GetGlyphShape(info_.get(), g.index, &verts);
  Point pen;
  for (int i = 0; i < n; i++) {
    const stbtt_vertex& v = verts[i];
    Point to{static_cast<double>(v.x), static_cast<double>(v.y)};
    switch (v.type) {
      case STBTT_vmove:
        g.contours.emplace_back();
        g.contours.back().push_back(to);
        break;
      case STBTT_vline:
        if (!g.contours.empty()) g.contours.back().push_back(to);
        break;
      case STBTT_vcurve:
        if (!g.contours.empty())
          flattenQuad(g.contours.back(), pen, {static_cast<double>(v.cx), static_cast<double>(v.cy)}, to);
        break;
      case STBTT_vcubic:
        if (!g.contours.empty())
          flattenCubic(g.contours.back(), pen,
                       {static_cast<double>(v.cx), static_cast<double>(v.cy)},
                       {static_cast<double>(v.cx1), static_cast<double>(v.cy1)}, to);
        break;
      default:
        break;
    }
    pen = to;
  }
  if (verts) stbtt_FreeShape(info_.get(), verts);

  return glyphs_.emplace(codepoint, std::move(g)).first->second;
}

double FontFace::advanceWidth(const std::string& utf8, double sizePx) const {
  if (!info_) return 0.0;
  double scale = scaleForSize(sizePx);
  int total = 0;
  int prev = -1;
  for (std::uint32_t cp : decodeUtf8(utf8)) {
    const Glyph& g = glyphFor(cp);
    if (prev >= 0) total += stbtt_GetGlyphKernAdvance(info_.get(), prev, g.index);
    total += g.advance;
    prev = g.index;
  }
  return total * scale;
}

std::vector<Contour> FontFace::textContours(const std::string& utf8, double sizePx) const {
  std::vector<Contour> out;
  if (!info_) return out;
  double scale = scaleForSize(sizePx);
  int penX = 0;
  int prev = -1;
  for (std::uint32_t cp : decodeUtf8(utf8)) {
    const Glyph& g = glyphFor(cp);
    if (prev >= 0) penX += stbtt_GetGlyphKernAdvance(info_.get(), prev, g.index);
    for (const auto& c : g.contours) {
      Contour pc;
      pc.reserve(c.size());
      for (const auto& p : c) pc.push_back({(penX + p.x) * scale, -p.y * scale});
      out.push_back(std::move(pc));
    }
    penX += g.advance;
    prev = g.index;
  }
  return out;
}

// ---------------------------------------------------------------------------
// FontRegistry
// ---------------------------------------------------------------------------

bool FontRegistry::add(const std::string& family, std::unique_ptr<FontFace> face) {
  if (!face || !face->isLoaded()) return false;
  if (defaultFamily_.empty()) defaultFamily_ = family;
  faces_[family] = std::move(face);
  return true;
}

bool FontRegistry::addFile(const std::string& family, const std::string& path) {
  auto face = std::make_unique<FontFace>();
  if (!face->loadFontFile(path)) return false;
  return add(family, std::move(face));
}

const FontFace* FontRegistry::find(const std::string& family) const {
  auto it = faces_.find(family);
  if (it != faces_.end()) return it->second.get();
  auto def = faces_.find(defaultFamily_);
  return def == faces_.end() ? nullptr : def->second.get();
}

} // namespace sg
