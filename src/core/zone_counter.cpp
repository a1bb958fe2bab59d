#include "core/zone_counter.hpp"

#include <utility>

namespace occ {

ZoneCounter::ZoneCounter(ZoneDefinition def) : def_(std::move(def)) {}

void ZoneCounter::decrement_inside(int class_id) {
  ZoneCount& c = per_class_[class_id];
  if (c.currently_inside > 0) --c.currently_inside;
}

ZoneTransition ZoneCounter::observe(std::uint64_t track_id, int class_id, const Point2f& center) {
  const bool inside = PointInPolygon(def_.points, center);
  Membership& m = members_[track_id];
  m.class_id = class_id;

  if (inside == m.inside) return ZoneTransition::None;
  m.inside = inside;

  if (inside) {
    if (!def_.classes.accepts(class_id)) return ZoneTransition::None;
    ZoneCount& c = per_class_[class_id];
    ++c.entries;
    ++c.currently_inside;
    m.counted = true;
    return ZoneTransition::Entered;
  }

  if (!m.counted) return ZoneTransition::None;
  m.counted = false;
  ++per_class_[class_id].exits;
  decrement_inside(class_id);
  return ZoneTransition::Exited;
}

void ZoneCounter::set_classes(ClassFilter classes) {
  def_.classes = std::move(classes);

  for (auto& kv : members_) {
    Membership& m = kv.second;
    const bool enabled = def_.classes.accepts(m.class_id);
    if (m.counted && !enabled) {
      decrement_inside(m.class_id);
      m.counted = false;
    } else if (m.inside && enabled && !m.counted) {
      ++per_class_[m.class_id].currently_inside;
      m.counted = true;
    }
  }
}

void ZoneCounter::release(std::uint64_t track_id) {
  auto it = members_.find(track_id);
  if (it == members_.end()) return;
  if (it->second.counted) decrement_inside(it->second.class_id);
  members_.erase(it);
}

void ZoneCounter::reset_counts() {
  per_class_.clear();
  members_.clear();
}

ZoneCounts ZoneCounter::counts() const {
  ZoneCounts c;
  c.id = def_.id;
  c.name = def_.name;
  c.per_class = per_class_;
  return c;
}

bool ZoneCounter::is_inside(std::uint64_t track_id) const {
  auto it = members_.find(track_id);
  return it != members_.end() && it->second.inside;
}

} // namespace occ
