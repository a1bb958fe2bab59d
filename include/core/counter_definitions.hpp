#pragma once

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/geometry.hpp"

namespace occ {

// Enabled classes for one counter. Default-constructed accepts every class;
// an explicit empty list accepts none.
struct ClassFilter {
  bool all{true};
  std::set<int> ids;

  static ClassFilter All() { return ClassFilter{}; }
  static ClassFilter None() { return ClassFilter{false, {}}; }
  static ClassFilter Only(std::set<int> ids) { return ClassFilter{false, std::move(ids)}; }

  bool accepts(int class_id) const { return all || ids.count(class_id) > 0; }
};

inline bool operator==(const ClassFilter& a, const ClassFilter& b) {
  if (a.all || b.all) return a.all == b.all;
  return a.ids == b.ids;
}

// Endpoint order is significant: it fixes which crossing direction is "in"
struct LineDefinition {
  std::string id;
  std::string name;
  Point2f start;
  Point2f end;
  ClassFilter classes{};

  Segment segment() const { return Segment{start, end}; }
};

// Vertex order is kept exactly as authored
struct ZoneDefinition {
  std::string id;
  std::string name;
  Polygon points;
  ClassFilter classes{};
};

// Throw InvalidGeometry when the definition cannot be counted against
void ValidateLineOrThrow(const LineDefinition& line);
void ValidateZoneOrThrow(const ZoneDefinition& zone);

// A full set of counters, as persisted alongside the frame size they were drawn on
struct CounterDefinitions {
  int width{0};
  int height{0};
  std::vector<LineDefinition> lines;
  std::vector<ZoneDefinition> zones;
};

// Rescale geometry drawn on a width x height frame to a new frame size
void ScaleCounterDefinitions(CounterDefinitions& defs, int new_width, int new_height);

} // namespace occ
