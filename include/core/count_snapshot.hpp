#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/track.hpp"

namespace occ {

struct LineCount {
  std::int64_t in{0};
  std::int64_t out{0};
};

struct ZoneCount {
  std::int64_t entries{0};
  std::int64_t exits{0};
  std::int64_t currently_inside{0};
};

// Per-class counts for one line, keyed by class id
struct LineCounts {
  std::string id;
  std::string name;
  std::map<int, LineCount> per_class;

  LineCount total() const {
    LineCount t;
    for (const auto& kv : per_class) {
      t.in += kv.second.in;
      t.out += kv.second.out;
    }
    return t;
  }

  LineCount of(int class_id) const {
    auto it = per_class.find(class_id);
    return it == per_class.end() ? LineCount{} : it->second;
  }
};

struct ZoneCounts {
  std::string id;
  std::string name;
  std::map<int, ZoneCount> per_class;

  ZoneCount total() const {
    ZoneCount t;
    for (const auto& kv : per_class) {
      t.entries += kv.second.entries;
      t.exits += kv.second.exits;
      t.currently_inside += kv.second.currently_inside;
    }
    return t;
  }

  ZoneCount of(int class_id) const {
    auto it = per_class.find(class_id);
    return it == per_class.end() ? ZoneCount{} : it->second;
  }
};

// Everything a consumer needs after one processed frame, by value
struct CountSnapshot {
  std::uint64_t frame_index{0};
  std::vector<LineCounts> lines;   // Registration order
  std::vector<ZoneCounts> zones;   // Registration order
  std::vector<TrackView> tracks;   // Active tracks, ordered by id
  std::uint64_t events{0};         // Crossings and zone transitions raised by this frame, 0 outside process()

  const LineCounts* line(const std::string& id) const {
    for (const auto& l : lines) {
      if (l.id == id) return &l;
    }
    return nullptr;
  }

  const ZoneCounts* zone(const std::string& id) const {
    for (const auto& z : zones) {
      if (z.id == id) return &z;
    }
    return nullptr;
  }
};

} // namespace occ
