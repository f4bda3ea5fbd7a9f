#include "sg/surface/RasterSurface.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sg {

namespace {

constexpr int kSubScanlines = 4;
constexpr double kPi = 3.14159265358979323846;

struct Crossing {
  double x;
  int dir;
};

// Signed-area sign of the stroke quads built below is negative (clockwise
// with y up); joins are emitted with the same orientation so that nonzero
// winding never cancels where pieces overlap.
Contour joinDisc(const Point& c, double r) {
  Contour out;
  constexpr int kSides = 8;
  for (int k = 0; k < kSides; k++) {
    double ang = -2.0 * kPi * k / kSides;
    out.push_back({c.x + r * std::cos(ang), c.y + r * std::sin(ang)});
  }
  return out;
}

float clamp01(float v) { return std::min(std::max(v, 0.0f), 1.0f); }

} // namespace

RasterSurface::RasterSurface(int width, int height)
  : w_(std::max(width, 0)), h_(std::max(height, 0)),
    px_(static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_)) {}

void RasterSurface::clear(const Color& c) {
  Premul p{c.r * c.a, c.g * c.a, c.b * c.a, c.a};
  std::fill(px_.begin(), px_.end(), p);
}

Color RasterSurface::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= w_ || y >= h_) return Color::transparent();
  const Premul& p = px_[static_cast<std::size_t>(y) * w_ + x];
  if (p.a <= 0.0f) return Color::transparent();
  return {p.r / p.a, p.g / p.a, p.b / p.a, p.a};
}

std::vector<std::uint8_t> RasterSurface::toRGBA8() const {
  std::vector<std::uint8_t> out(px_.size() * 4);
  for (std::size_t i = 0; i < px_.size(); i++) {
    const Premul& p = px_[i];
    float inv = p.a > 0.0f ? 1.0f / p.a : 0.0f;
    out[i * 4 + 0] = static_cast<std::uint8_t>(std::lround(clamp01(p.r * inv) * 255.0f));
    out[i * 4 + 1] = static_cast<std::uint8_t>(std::lround(clamp01(p.g * inv) * 255.0f));
    out[i * 4 + 2] = static_cast<std::uint8_t>(std::lround(clamp01(p.b * inv) * 255.0f));
    out[i * 4 + 3] = static_cast<std::uint8_t>(std::lround(clamp01(p.a) * 255.0f));
  }
  return out;
}

// ---------------------------------------------------------------------------
// State
// ---------------------------------------------------------------------------

void RasterSurface::save() {
  stack_.push_back(state_);
}

void RasterSurface::restore() {
  if (stack_.empty()) return;
  state_ = stack_.back();
  stack_.pop_back();
}

void RasterSurface::translate(double dx, double dy) {
  state_.matrix = state_.matrix.multiplied(Matrix::translation(dx, dy));
}

void RasterSurface::transform(const Matrix& m) {
  state_.matrix = state_.matrix.multiplied(m);
}

void RasterSurface::beginLayer() {
  layers_.push_back({std::move(px_), state_.op});
  px_.assign(static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_), Premul{});
  state_.op = CompositeOp::SourceOver;
}

void RasterSurface::endLayer() {
  if (layers_.empty()) return;
  Pixels layer = std::move(px_);
  px_ = std::move(layers_.back().below);
  const int bits = static_cast<int>(layers_.back().op);
  layers_.pop_back();

  // Transparent layer pixels still go through the blend so unbounded
  // operators clear the target outside the layer's content.
  for (std::size_t i = 0; i < px_.size(); i++) px_[i] = blend(bits, layer[i], px_[i]);
}

// ---------------------------------------------------------------------------
// Rasterization
// ---------------------------------------------------------------------------

std::vector<Contour> RasterSurface::toDevice(const std::vector<Contour>& user) const {
  std::vector<Contour> out;
  out.reserve(user.size());
  for (const auto& c : user) {
    Contour dc;
    dc.reserve(c.size());
    for (const auto& p : c) dc.push_back(state_.matrix.apply(p));
    out.push_back(std::move(dc));
  }
  return out;
}

void RasterSurface::rasterize(const std::vector<Contour>& device,
                              std::vector<float>& coverage) const {
  coverage.assign(static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_), 0.0f);
  if (w_ == 0 || h_ == 0) return;

  double minY = 1e300, maxY = -1e300;
  for (const auto& c : device)
    for (const auto& p : c) { minY = std::min(minY, p.y); maxY = std::max(maxY, p.y); }
  if (!(minY <= maxY) || maxY < 0 || minY > h_) return;

  // Clamp in double before converting; far-off coordinates overflow int.
  int row0 = static_cast<int>(std::floor(std::max(minY, 0.0)));
  int row1 = std::min(h_ - 1, static_cast<int>(std::ceil(std::min(maxY, static_cast<double>(h_)))));
  const float subWeight = 1.0f / kSubScanlines;

  std::vector<Crossing> xs;
  for (int row = row0; row <= row1; row++) {
    float* out = &coverage[static_cast<std::size_t>(row) * w_];
    for (int s = 0; s < kSubScanlines; s++) {
      double sy = row + (s + 0.5) / kSubScanlines;
      xs.clear();
      for (const auto& c : device) {
        std::size_t n = c.size();
        if (n < 2) continue;
        for (std::size_t i = 0; i < n; i++) {
          const Point& p0 = c[i];
          const Point& p1 = c[(i + 1) % n];
          if (p0.y == p1.y) continue;
          bool down = p1.y > p0.y;
          double y0 = down ? p0.y : p1.y;
          double y1 = down ? p1.y : p0.y;
          if (sy < y0 || sy >= y1) continue;
          double t = (sy - p0.y) / (p1.y - p0.y);
          xs.push_back({p0.x + t * (p1.x - p0.x), down ? 1 : -1});
        }
      }
      if (xs.size() < 2) continue;
      std::sort(xs.begin(), xs.end(),
                [](const Crossing& a, const Crossing& b) { return a.x < b.x; });

      int winding = 0;
      for (std::size_t i = 0; i + 1 < xs.size(); i++) {
        winding += xs[i].dir;
        if (winding == 0) continue;
        double xa = std::min(std::max(xs[i].x, 0.0), static_cast<double>(w_));
        double xb = std::max(std::min(xs[i + 1].x, static_cast<double>(w_)), 0.0);
        if (!(xb > xa)) continue;
        int px0 = static_cast<int>(std::floor(xa));
        int px1 = std::min(w_ - 1, static_cast<int>(std::ceil(xb)) - 1);
        for (int px = px0; px <= px1; px++) {
          double overlap = std::min(xb, px + 1.0) - std::max(xa, static_cast<double>(px));
          if (overlap > 0) out[px] += static_cast<float>(overlap) * subWeight;
        }
      }
    }
  }
}

RasterSurface::Premul RasterSurface::blend(int bits, const Premul& f, const Premul& b) {
  float wS = (bits & 1) ? b.a : 0.0f;
  if (bits & 2) wS = 1.0f - wS;
  float wB = (bits & 4) ? f.a : 0.0f;
  if (bits & 8) wB = 1.0f - wB;
  Premul r{wS * f.r + wB * b.r, wS * f.g + wB * b.g,
           wS * f.b + wB * b.b, wS * f.a + wB * b.a};
  r.a = std::min(r.a, 1.0f);
  r.r = std::min(r.r, r.a);
  r.g = std::min(r.g, r.a);
  r.b = std::min(r.b, r.a);
  return r;
}

void RasterSurface::composite(const std::vector<float>& coverage, const Color& color,
                              CompositeOp op) {
  const int bits = static_cast<int>(op);
  const bool unbounded = affectsUncovered(op);
  const float ca = clamp01(color.a);
  const Premul fore{color.r * ca, color.g * ca, color.b * ca, ca};

  for (std::size_t i = 0; i < px_.size(); i++) {
    float c = std::min(coverage[i], 1.0f);
    if (c <= 0.0f && !unbounded) continue;
    Premul& back = px_[i];
    Premul covered = blend(bits, fore, back);
    Premul bare = unbounded ? blend(bits, Premul{}, back) : back;
    back.r = c * covered.r + (1.0f - c) * bare.r;
    back.g = c * covered.g + (1.0f - c) * bare.g;
    back.b = c * covered.b + (1.0f - c) * bare.b;
    back.a = c * covered.a + (1.0f - c) * bare.a;
  }
}

std::vector<Contour> RasterSurface::strokeOutline(const Contour& pts, bool closed,
                                                  double width) const {
  std::vector<Contour> out;
  double hw = width * 0.5;
  if (pts.empty() || hw <= 0) return out;

  std::size_t n = pts.size();
  std::size_t segs = closed ? n : n - 1;
  for (std::size_t i = 0; i < segs; i++) {
    const Point& a = pts[i];
    const Point& b = pts[(i + 1) % n];
    double dx = b.x - a.x, dy = b.y - a.y;
    double len = std::sqrt(dx * dx + dy * dy);
    if (len == 0) continue;
    double nx = -dy / len * hw, ny = dx / len * hw;
    out.push_back({{a.x + nx, a.y + ny}, {b.x + nx, b.y + ny},
                   {b.x - nx, b.y - ny}, {a.x - nx, a.y - ny}});
  }

  std::size_t first = closed ? 0 : 1;
  std::size_t last = closed ? n : n - 1;
  for (std::size_t i = first; i < last; i++) out.push_back(joinDisc(pts[i], hw));
  return out;
}

void RasterSurface::fillPath(const std::vector<Point>& pts, bool /*closed*/) {
  if (pts.size() < 3) return;
  std::vector<float> cov;
  rasterize(toDevice({pts}), cov);
  composite(cov, state_.fill, state_.op);
}

void RasterSurface::strokePath(const std::vector<Point>& pts, bool closed) {
  if (pts.size() < 2) return;
  std::vector<float> cov;
  rasterize(toDevice(strokeOutline(pts, closed, state_.lineWidth)), cov);
  composite(cov, state_.stroke, state_.op);
}

// ---------------------------------------------------------------------------
// Text
// ---------------------------------------------------------------------------

const FontFace* RasterSurface::currentFace() {
  const FontFace* face = fonts_ ? fonts_->find(state_.font.family) : nullptr;
  if (!face && !warnedNoFont_) {
    std::fprintf(stderr, "RasterSurface: no font for family '%s', text skipped\n",
                 state_.font.family.c_str());
    warnedNoFont_ = true;
  }
  return face;
}

double RasterSurface::alignOffset(const std::string& text, const FontFace& face) const {
  switch (state_.align) {
    case Justification::Center: return -face.advanceWidth(text, state_.font.sizePx) * 0.5;
    case Justification::Right: return -face.advanceWidth(text, state_.font.sizePx);
    default: return 0.0;
  }
}

double RasterSurface::measureText(const std::string& text) {
  const FontFace* face = currentFace();
  return face ? face->advanceWidth(text, state_.font.sizePx) : 0.0;
}

void RasterSurface::fillText(const std::string& text, double x, double y) {
  const FontFace* face = currentFace();
  if (!face || text.empty()) return;
  double ox = x + alignOffset(text, *face);
  std::vector<Contour> glyphs = face->textContours(text, state_.font.sizePx);
  for (auto& c : glyphs)
    for (auto& p : c) { p.x += ox; p.y += y; }
  std::vector<float> cov;
  rasterize(toDevice(glyphs), cov);
  composite(cov, state_.fill, state_.op);
}

void RasterSurface::strokeText(const std::string& text, double x, double y) {
  const FontFace* face = currentFace();
  if (!face || text.empty()) return;
  double ox = x + alignOffset(text, *face);
  std::vector<Contour> outline;
  for (auto& c : face->textContours(text, state_.font.sizePx)) {
    for (auto& p : c) { p.x += ox; p.y += y; }
    std::vector<Contour> s = strokeOutline(c, true, state_.lineWidth);
    outline.insert(outline.end(), s.begin(), s.end());
  }
  std::vector<float> cov;
  rasterize(toDevice(outline), cov);
  composite(cov, state_.stroke, state_.op);
}

} // namespace sg
