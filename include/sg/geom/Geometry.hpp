#pragma once
#include <algorithm>
#include <cmath>
#include <vector>

namespace sg {

struct Point {
  double x{0}, y{0};
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

inline Point floorPoint(const Point& p) {
  return {std::floor(p.x), std::floor(p.y)};
}

// Axis-aligned rectangle. x/y is the top-left corner (y grows downward).
struct Rect {
  double x{0}, y{0};
  double width{0}, height{0};

  Point topLeft() const { return {x, y}; }
  Point bottomRight() const { return {x + width, y + height}; }
  double right() const { return x + width; }
  double bottom() const { return y + height; }
  bool isEmpty() const { return width == 0 || height == 0; }

  Rect expanded(double d) const { return {x - d, y - d, width + 2 * d, height + 2 * d}; }
};

inline bool operator==(const Rect& a, const Rect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

inline Rect rectFromPoints(const Point& a, const Point& b) {
  double x0 = std::min(a.x, b.x), y0 = std::min(a.y, b.y);
  double x1 = std::max(a.x, b.x), y1 = std::max(a.y, b.y);
  return {x0, y0, x1 - x0, y1 - y0};
}

// Bounding box of a point set. Empty input yields a zero rect at the origin.
inline Rect boundsOf(const std::vector<Point>& pts) {
  if (pts.empty()) return {};
  double x0 = pts[0].x, y0 = pts[0].y, x1 = x0, y1 = y0;
  for (const auto& p : pts) {
    x0 = std::min(x0, p.x); y0 = std::min(y0, p.y);
    x1 = std::max(x1, p.x); y1 = std::max(y1, p.y);
  }
  return {x0, y0, x1 - x0, y1 - y0};
}

// Union where a flag tracks whether `acc` holds anything yet.
inline void unite(Rect& acc, bool& hasAcc, const Rect& r) {
  if (!hasAcc) { acc = r; hasAcc = true; return; }
  double x0 = std::min(acc.x, r.x), y0 = std::min(acc.y, r.y);
  double x1 = std::max(acc.right(), r.right()), y1 = std::max(acc.bottom(), r.bottom());
  acc = {x0, y0, x1 - x0, y1 - y0};
}

// 2D affine transform, canvas convention:
//   x' = a*x + c*y + tx
//   y' = b*x + d*y + ty
struct Matrix {
  double a{1}, b{0}, c{0}, d{1}, tx{0}, ty{0};

  static Matrix translation(double dx, double dy) { return {1, 0, 0, 1, dx, dy}; }
  static Matrix scaling(double sx, double sy) { return {sx, 0, 0, sy, 0, 0}; }
  static Matrix rotation(double radians) {
    double cs = std::cos(radians), sn = std::sin(radians);
    return {cs, sn, -sn, cs, 0, 0};
  }

  bool isIdentity() const {
    return a == 1 && b == 0 && c == 0 && d == 1 && tx == 0 && ty == 0;
  }

  Point apply(const Point& p) const {
    return {a * p.x + c * p.y + tx, b * p.x + d * p.y + ty};
  }

  // this * other: `other` is applied first.
  Matrix multiplied(const Matrix& o) const {
    return {a * o.a + c * o.b,
            b * o.a + d * o.b,
            a * o.c + c * o.d,
            b * o.c + d * o.d,
            a * o.tx + c * o.ty + tx,
            b * o.tx + d * o.ty + ty};
  }

  // Largest axis scale; used to scale stroke widths and text sizes.
  double maxScale() const {
    double sx = std::sqrt(a * a + b * b);
    double sy = std::sqrt(c * c + d * d);
    return std::max(sx, sy);
  }

  // Axis-aligned bounds of a transformed rectangle.
  Rect mapRect(const Rect& r) const {
    if (isIdentity()) return r;
    std::vector<Point> corners = {
      apply({r.x, r.y}), apply({r.right(), r.y}),
      apply({r.right(), r.bottom()}), apply({r.x, r.bottom()})
    };
    return boundsOf(corners);
  }
};

inline bool operator==(const Matrix& m, const Matrix& n) {
  return m.a == n.a && m.b == n.b && m.c == n.c && m.d == n.d && m.tx == n.tx && m.ty == n.ty;
}
inline bool operator!=(const Matrix& m, const Matrix& n) { return !(m == n); }

} // namespace sg
