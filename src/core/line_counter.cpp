#include "core/line_counter.hpp"

#include <utility>

namespace occ {

LineCounter::LineCounter(LineDefinition def) : def_(std::move(def)) {}

CrossingDirection LineCounter::observe(std::uint64_t track_id, int class_id, const Point2f& prev, const Point2f& curr) {
  const Segment seg = def_.segment();

  auto it = last_side_.find(track_id);
  if (it == last_side_.end()) {
    const int seed = SideSign(seg, prev);
    if (seed == 0) {
      const int now = SideSign(seg, curr);
      if (now != 0) last_side_[track_id] = now;
      return CrossingDirection::None;
    }
    it = last_side_.emplace(track_id, seed).first;
  }

  const int side = SideSign(seg, curr);
  if (side == 0) return CrossingDirection::None;

  const int before = it->second;
  it->second = side;
  if (before != -side) return CrossingDirection::None;

  const CrossingDirection dir = side > 0 ? CrossingDirection::In : CrossingDirection::Out;
  if (!def_.classes.accepts(class_id)) return CrossingDirection::None;

  LineCount& c = per_class_[class_id];
  if (dir == CrossingDirection::In) ++c.in;
  else ++c.out;
  return dir;
}

void LineCounter::forget(std::uint64_t track_id) {
  last_side_.erase(track_id);
}

void LineCounter::reset_counts() {
  per_class_.clear();
  last_side_.clear();
}

LineCounts LineCounter::counts() const {
  LineCounts c;
  c.id = def_.id;
  c.name = def_.name;
  c.per_class = per_class_;
  return c;
}

} // namespace occ
