#include "core/counter_definitions.hpp"

#include <cmath>
#include <stdexcept>

#include "core/errors.hpp"

namespace occ {

static bool IsFinite(const Point2f& p) {
  return std::isfinite(p.x) && std::isfinite(p.y);
}

void ValidateLineOrThrow(const LineDefinition& line) {
  if (line.id.empty()) throw InvalidGeometry(line.id, "counter id must not be empty");
  if (!IsFinite(line.start) || !IsFinite(line.end)) throw InvalidGeometry(line.id, "endpoints must be finite");
  if (SegmentLength(line.segment()) < kSideEpsilon) throw InvalidGeometry(line.id, "line has zero length");
}

void ValidateZoneOrThrow(const ZoneDefinition& zone) {
  if (zone.id.empty()) throw InvalidGeometry(zone.id, "counter id must not be empty");
  if (zone.points.size() < 3)
    throw InvalidGeometry(zone.id, "zone needs at least 3 vertices, got " + std::to_string(zone.points.size()));
  for (const auto& p : zone.points) {
    if (!IsFinite(p)) throw InvalidGeometry(zone.id, "vertices must be finite");
  }
  if (std::abs(PolygonArea(zone.points)) < kSideEpsilon) throw InvalidGeometry(zone.id, "zone has zero area");
  if (!IsSimplePolygon(zone.points)) throw InvalidGeometry(zone.id, "zone edges intersect");
}

void ScaleCounterDefinitions(CounterDefinitions& defs, int new_width, int new_height) {
  if (new_width <= 0 || new_height <= 0) throw std::invalid_argument("frame size must be > 0");
  if (new_width == defs.width && new_height == defs.height) return;
  if (defs.width <= 0 || defs.height <= 0) {
    // Nothing to scale from, adopt the new size
    defs.width = new_width;
    defs.height = new_height;
    return;
  }

  const float sx = static_cast<float>(new_width) / static_cast<float>(defs.width);
  const float sy = static_cast<float>(new_height) / static_cast<float>(defs.height);

  auto scale = [&](Point2f& p) {
    p.x *= sx;
    p.y *= sy;
  };

  for (auto& l : defs.lines) {
    scale(l.start);
    scale(l.end);
  }
  for (auto& z : defs.zones) {
    for (auto& p : z.points) scale(p);
  }

  defs.width = new_width;
  defs.height = new_height;
}

} // namespace occ
