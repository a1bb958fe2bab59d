#include "core/counter_definitions.hpp"
#include "core/errors.hpp"
#include "core/geometry.hpp"

#include "check.hpp"

using occ::test::Near;

static void TestSide() {
  const occ::Segment line{{0.f, 50.f}, {100.f, 50.f}};

  OCC_CHECK(occ::test::Eq(occ::SideSign(line, {50.f, 10.f}), -1));
  OCC_CHECK(occ::test::Eq(occ::SideSign(line, {50.f, 90.f}), 1));
  OCC_CHECK(occ::test::Eq(occ::SideSign(line, {50.f, 50.f}), 0));
  // Beyond the endpoints the infinite line still decides
  OCC_CHECK(occ::test::Eq(occ::SideSign(line, {500.f, 90.f}), 1));

  // Swapping the endpoints swaps the half-planes
  const occ::Segment reversed{{100.f, 50.f}, {0.f, 50.f}};
  OCC_CHECK(occ::test::Eq(occ::SideSign(reversed, {50.f, 90.f}), -1));
}

static void TestPointInPolygon() {
  const occ::Polygon square{{0.f, 0.f}, {10.f, 0.f}, {10.f, 10.f}, {0.f, 10.f}};
  OCC_CHECK(occ::PointInPolygon(square, {5.f, 5.f}));
  OCC_CHECK(!occ::PointInPolygon(square, {15.f, 5.f}));
  OCC_CHECK(!occ::PointInPolygon(square, {10.f, 5.f}));   // edge
  OCC_CHECK(!occ::PointInPolygon(square, {0.f, 0.f}));    // vertex

  // L shape, the notch is outside
  const occ::Polygon ell{{0.f, 0.f}, {10.f, 0.f}, {10.f, 4.f}, {4.f, 4.f}, {4.f, 10.f}, {0.f, 10.f}};
  OCC_CHECK(occ::PointInPolygon(ell, {2.f, 8.f}));
  OCC_CHECK(occ::PointInPolygon(ell, {8.f, 2.f}));
  OCC_CHECK(!occ::PointInPolygon(ell, {8.f, 8.f}));

  OCC_CHECK(!occ::PointInPolygon(occ::Polygon{{0.f, 0.f}, {1.f, 1.f}}, {0.5f, 0.5f}));
}

static void TestSegmentsIntersect() {
  OCC_CHECK(occ::SegmentsIntersect({{0.f, 0.f}, {10.f, 10.f}}, {{0.f, 10.f}, {10.f, 0.f}}));
  OCC_CHECK(!occ::SegmentsIntersect({{0.f, 0.f}, {10.f, 0.f}}, {{0.f, 1.f}, {10.f, 1.f}}));
  OCC_CHECK(occ::SegmentsIntersect({{0.f, 0.f}, {5.f, 0.f}}, {{5.f, 0.f}, {5.f, 5.f}}));
  OCC_CHECK(occ::SegmentsIntersect({{0.f, 0.f}, {5.f, 0.f}}, {{3.f, 0.f}, {8.f, 0.f}}));
  OCC_CHECK(!occ::SegmentsIntersect({{0.f, 0.f}, {2.f, 0.f}}, {{3.f, 0.f}, {5.f, 0.f}}));
}

static void TestPolygonShape() {
  const occ::Polygon square{{0.f, 0.f}, {10.f, 0.f}, {10.f, 10.f}, {0.f, 10.f}};
  OCC_CHECK(Near(occ::PolygonArea(square), 100.0));
  OCC_CHECK(occ::IsSimplePolygon(square));

  const occ::Polygon bowtie{{0.f, 0.f}, {10.f, 10.f}, {10.f, 0.f}, {0.f, 10.f}};
  OCC_CHECK(!occ::IsSimplePolygon(bowtie));
}

static void TestBoxes() {
  const occ::BBox a{0.f, 0.f, 10.f, 10.f};
  const occ::BBox b{5.f, 0.f, 15.f, 10.f};
  const occ::BBox far{100.f, 100.f, 110.f, 110.f};

  OCC_CHECK(Near(occ::IoU(a, a), 1.0));
  OCC_CHECK(Near(occ::IoU(a, b), 1.0 / 3.0));
  OCC_CHECK(Near(occ::IoU(a, far), 0.0));

  const occ::Point2f c = occ::Center(occ::BBox{0.f, 0.f, 10.f, 20.f});
  OCC_CHECK(Near(c.x, 5.0) && Near(c.y, 10.0));

  OCC_CHECK(Near(occ::SegmentLength({{0.f, 0.f}, {3.f, 4.f}}), 5.0));
}

static void TestValidation() {
  occ::LineDefinition line{"l1", "Line", {0.f, 0.f}, {0.f, 0.f}};
  OCC_CHECK(occ::test::Throws<occ::InvalidGeometry>([&] { occ::ValidateLineOrThrow(line); }));
  line.end = {10.f, 0.f};
  occ::ValidateLineOrThrow(line);

  occ::ZoneDefinition zone{"z1", "Zone", {{0.f, 0.f}, {10.f, 0.f}}};
  OCC_CHECK(occ::test::Throws<occ::InvalidGeometry>([&] { occ::ValidateZoneOrThrow(zone); }));

  zone.points = {{0.f, 0.f}, {5.f, 0.f}, {10.f, 0.f}};
  OCC_CHECK(occ::test::Throws<occ::InvalidGeometry>([&] { occ::ValidateZoneOrThrow(zone); }));

  zone.points = {{0.f, 0.f}, {10.f, 10.f}, {10.f, 0.f}, {0.f, 10.f}};
  OCC_CHECK(occ::test::Throws<occ::InvalidGeometry>([&] { occ::ValidateZoneOrThrow(zone); }));

  zone.points = {{0.f, 0.f}, {10.f, 0.f}, {10.f, 10.f}};
  occ::ValidateZoneOrThrow(zone);
}

int main() {
  TestSide();
  TestPointInPolygon();
  TestSegmentsIntersect();
  TestPolygonShape();
  TestBoxes();
  TestValidation();
  return occ::test::Finish("geometry_test");
}
