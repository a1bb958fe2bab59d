#include "core/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace occ {

double Side(const Segment& segment, const Point2f& point) {
  const double dx = static_cast<double>(segment.p2.x) - segment.p1.x;
  const double dy = static_cast<double>(segment.p2.y) - segment.p1.y;
  const double px = static_cast<double>(point.x) - segment.p1.x;
  const double py = static_cast<double>(point.y) - segment.p1.y;
  return dx * py - dy * px;
}

int SideSign(const Segment& segment, const Point2f& point) {
  const double v = Side(segment, point);
  if (std::abs(v) < kSideEpsilon) return 0;
  return v > 0.0 ? 1 : -1;
}

// p is collinear with a-b and inside its bounding box
static bool OnSegment(const Point2f& a, const Point2f& b, const Point2f& p) {
  if (SideSign(Segment{a, b}, p) != 0) return false;
  return p.x >= std::min(a.x, b.x) && p.x <= std::max(a.x, b.x) &&
         p.y >= std::min(a.y, b.y) && p.y <= std::max(a.y, b.y);
}

bool PointInPolygon(const Polygon& polygon, const Point2f& point) {
  const std::size_t n = polygon.size();
  if (n < 3) return false;

  // Boundary counts as outside so jitter along an edge cannot toggle containment
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    if (OnSegment(polygon[j], polygon[i], point)) return false;
  }

  bool inside = false;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Point2f& a = polygon[i];
    const Point2f& b = polygon[j];
    if ((a.y > point.y) != (b.y > point.y)) {
      const double x_cross = static_cast<double>(b.x - a.x) * (point.y - a.y) / (b.y - a.y) + a.x;
      if (point.x < x_cross) inside = !inside;
    }
  }
  return inside;
}

bool SegmentsIntersect(const Segment& a, const Segment& b) {
  const int o1 = SideSign(a, b.p1);
  const int o2 = SideSign(a, b.p2);
  const int o3 = SideSign(b, a.p1);
  const int o4 = SideSign(b, a.p2);

  if (o1 != o2 && o3 != o4 && o1 != 0 && o2 != 0 && o3 != 0 && o4 != 0) return true;

  // Touching and collinear cases
  if (o1 == 0 && OnSegment(a.p1, a.p2, b.p1)) return true;
  if (o2 == 0 && OnSegment(a.p1, a.p2, b.p2)) return true;
  if (o3 == 0 && OnSegment(b.p1, b.p2, a.p1)) return true;
  if (o4 == 0 && OnSegment(b.p1, b.p2, a.p2)) return true;

  return false;
}

double PolygonArea(const Polygon& polygon) {
  const std::size_t n = polygon.size();
  if (n < 3) return 0.0;

  double twice = 0.0;
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    twice += static_cast<double>(polygon[j].x) * polygon[i].y - static_cast<double>(polygon[i].x) * polygon[j].y;
  }
  return 0.5 * twice;
}

bool IsSimplePolygon(const Polygon& polygon) {
  const std::size_t n = polygon.size();
  if (n < 3) return false;

  auto edge = [&](std::size_t i) { return Segment{polygon[i], polygon[(i + 1) % n]}; };

  for (std::size_t i = 0; i < n; ++i) {
    const Segment ei = edge(i);
    if (ei.p1 == ei.p2) return false;

    for (std::size_t j = i + 1; j < n; ++j) {
      const Segment ej = edge(j);
      const bool adjacent = (j == i + 1) || (i == 0 && j == n - 1);

      if (!adjacent) {
        if (SegmentsIntersect(ei, ej)) return false;
        continue;
      }

      // Adjacent edges share one vertex; folding back over each other is self-intersection
      const Point2f& far_i = (j == i + 1) ? ei.p1 : ei.p2;
      const Point2f& far_j = (j == i + 1) ? ej.p2 : ej.p1;
      if (OnSegment(ei.p1, ei.p2, far_j) || OnSegment(ej.p1, ej.p2, far_i)) return false;
    }
  }
  return true;
}

double SegmentLength(const Segment& segment) {
  const double dx = static_cast<double>(segment.p2.x) - segment.p1.x;
  const double dy = static_cast<double>(segment.p2.y) - segment.p1.y;
  return std::sqrt(dx * dx + dy * dy);
}

Point2f Center(const BBox& box) {
  return Point2f{0.5f * (box.x1 + box.x2), 0.5f * (box.y1 + box.y2)};
}

float IoU(const BBox& a, const BBox& b) {
  const float ix1 = std::max(a.x1, b.x1);
  const float iy1 = std::max(a.y1, b.y1);
  const float ix2 = std::min(a.x2, b.x2);
  const float iy2 = std::min(a.y2, b.y2);

  const float iw = std::max(0.f, ix2 - ix1);
  const float ih = std::max(0.f, iy2 - iy1);
  const float inter = iw * ih;

  const float area_a = std::max(0.f, a.width()) * std::max(0.f, a.height());
  const float area_b = std::max(0.f, b.width()) * std::max(0.f, b.height());
  const float ua = area_a + area_b - inter;
  return (ua <= 0.f) ? 0.f : (inter / ua);
}

} // namespace occ
