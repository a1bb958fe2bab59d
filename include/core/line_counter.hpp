#pragma once

#include <cstdint>
#include <map>
#include <utility>

#include "core/count_snapshot.hpp"
#include "core/counter_definitions.hpp"

namespace occ {

enum class CrossingDirection {
  None,
  In,   // Onto the positive side of (end - start) x (p - start)
  Out   // Onto the negative side
};

/*
    LineCounter keeps, per track id, the last non-zero side of the line the track's center was seen on.
    A crossing fires when a new sample lands strictly on the opposite side. Samples exactly on the line
    neither fire nor overwrite the remembered side, so resting on the line never counts and passing
    through it counts once.
*/
class LineCounter {
public:
  explicit LineCounter(LineDefinition def);

  // Feed one new sample. prev is the track's previous center (equal to curr for a new track)
  CrossingDirection observe(std::uint64_t track_id, int class_id, const Point2f& prev, const Point2f& curr);

  // Drop per-track state once the track is gone
  void forget(std::uint64_t track_id);

  void reset_counts();

  void set_classes(ClassFilter classes) { def_.classes = std::move(classes); }

  const LineDefinition& definition() const { return def_; }
  LineCounts counts() const;

  std::size_t tracked() const { return last_side_.size(); }

private:
  LineDefinition def_;
  std::map<int, LineCount> per_class_;
  std::map<std::uint64_t, int> last_side_;
};

} // namespace occ
