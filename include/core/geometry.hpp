#pragma once

#include <vector>

#include "core/detections.hpp"

/*
    Stateless geometry over frame pixel coordinates. Everything the counters decide is built on
    three tests: which side of a line a point lies on, whether a point is inside a polygon, and
    whether two segments intersect (used to validate polygons).
*/

namespace occ {

struct Point2f {
  float x{0.f};
  float y{0.f};
};

inline bool operator==(const Point2f& a, const Point2f& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2f& a, const Point2f& b) { return !(a == b); }

struct Segment {
  Point2f p1;
  Point2f p2;
};

using Polygon = std::vector<Point2f>;

// Magnitudes below this are "on the line"
constexpr double kSideEpsilon = 1e-6;

// Cross product (p2 - p1) x (point - p1). Positive and negative are the two half-planes
double Side(const Segment& segment, const Point2f& point);

// Side() reduced to -1, 0 or +1
int SideSign(const Segment& segment, const Point2f& point);

// Even-odd ray casting. Points on an edge or a vertex are outside
bool PointInPolygon(const Polygon& polygon, const Point2f& point);

// True if the closed segments share at least one point, collinear overlaps included
bool SegmentsIntersect(const Segment& a, const Segment& b);

// Signed shoelace area, positive for counter-clockwise vertex order in a y-up frame
double PolygonArea(const Polygon& polygon);

// No two non-adjacent edges touch, and adjacent edges only share their common vertex
bool IsSimplePolygon(const Polygon& polygon);

double SegmentLength(const Segment& segment);

Point2f Center(const BBox& box);

float IoU(const BBox& a, const BBox& b);

} // namespace occ
