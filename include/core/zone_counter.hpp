#pragma once

#include <cstdint>
#include <map>
#include <utility>

#include "core/count_snapshot.hpp"
#include "core/counter_definitions.hpp"

namespace occ {

enum class ZoneTransition {
  None,
  Entered,
  Exited
};

// Tracks per-track containment for one polygon and keeps per-class entries/exits/occupancy
class ZoneCounter {
public:
  explicit ZoneCounter(ZoneDefinition def);

  // Feed the track's current center
  ZoneTransition observe(std::uint64_t track_id, int class_id, const Point2f& center);

  // Track left the active set (Lost or purged). If it was counted inside, occupancy drops without an exit
  void release(std::uint64_t track_id);

  void reset_counts();

  // Tracks already inside join or leave occupancy under the new filter, with no entry or exit recorded
  void set_classes(ClassFilter classes);

  const ZoneDefinition& definition() const { return def_; }
  ZoneCounts counts() const;

  // Whether the track is currently inside per the last observation
  bool is_inside(std::uint64_t track_id) const;

private:
  struct Membership {
    bool inside{false};
    bool counted{false};   // Contributes to currently_inside of class_id
    int class_id{-1};
  };

  void decrement_inside(int class_id);

  ZoneDefinition def_;
  std::map<int, ZoneCount> per_class_;
  std::map<std::uint64_t, Membership> members_;
};

} // namespace occ
