#include "core/counting_engine.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "core/errors.hpp"
#include "core/labels/general_labels.hpp"

namespace occ {

CountingEngine::CountingEngine(TrackingConfig tracking, CountingConfig counting)
    : counting_cfg_(std::move(counting)), tracker_(std::move(tracking)) {}

void CountingEngine::ensure_unique(const std::string& id) const {
  if (has_counter(id)) throw DuplicateCounterId(id);
}

bool CountingEngine::has_counter(const std::string& id) const {
  for (const auto& l : lines_) {
    if (l.definition().id == id) return true;
  }
  for (const auto& z : zones_) {
    if (z.definition().id == id) return true;
  }
  return false;
}

void CountingEngine::add_line(LineDefinition line) {
  ValidateLineOrThrow(line);
  ensure_unique(line.id);
  lines_.emplace_back(std::move(line));
}

void CountingEngine::add_zone(ZoneDefinition zone) {
  ValidateZoneOrThrow(zone);
  ensure_unique(zone.id);
  zones_.emplace_back(std::move(zone));
}

void CountingEngine::load_definitions(const CounterDefinitions& defs) {
  // Check the whole batch first so a bad entry leaves the engine untouched
  std::vector<std::string> ids;
  for (const auto& l : defs.lines) {
    ValidateLineOrThrow(l);
    ids.push_back(l.id);
  }
  for (const auto& z : defs.zones) {
    ValidateZoneOrThrow(z);
    ids.push_back(z.id);
  }
  std::sort(ids.begin(), ids.end());
  auto dup = std::adjacent_find(ids.begin(), ids.end());
  if (dup != ids.end()) throw DuplicateCounterId(*dup);
  for (const auto& id : ids) ensure_unique(id);

  for (const auto& l : defs.lines) lines_.emplace_back(l);
  for (const auto& z : defs.zones) zones_.emplace_back(z);
}

void CountingEngine::remove_counter(const std::string& id) {
  auto lit = std::find_if(lines_.begin(), lines_.end(), [&](const LineCounter& l) { return l.definition().id == id; });
  if (lit != lines_.end()) {
    lines_.erase(lit);
    return;
  }
  auto zit = std::find_if(zones_.begin(), zones_.end(), [&](const ZoneCounter& z) { return z.definition().id == id; });
  if (zit != zones_.end()) {
    zones_.erase(zit);
    return;
  }
  throw UnknownCounterId(id);
}

void CountingEngine::set_enabled_classes(const std::string& id, ClassFilter classes) {
  for (auto& l : lines_) {
    if (l.definition().id == id) {
      l.set_classes(std::move(classes));
      return;
    }
  }
  for (auto& z : zones_) {
    if (z.definition().id == id) {
      z.set_classes(std::move(classes));
      return;
    }
  }
  throw UnknownCounterId(id);
}

std::vector<LineDefinition> CountingEngine::line_definitions() const {
  std::vector<LineDefinition> v;
  v.reserve(lines_.size());
  for (const auto& l : lines_) v.push_back(l.definition());
  return v;
}

std::vector<ZoneDefinition> CountingEngine::zone_definitions() const {
  std::vector<ZoneDefinition> v;
  v.reserve(zones_.size());
  for (const auto& z : zones_) v.push_back(z.definition());
  return v;
}

CountSnapshot CountingEngine::process(std::uint64_t frame_index, const std::vector<Detection>& detections) {
  if (faulted_) throw SessionFaulted();
  if (has_frame_ && frame_index <= last_frame_index_) {
    faulted_ = true;
    throw OutOfOrderFrame(frame_index, last_frame_index_);
  }
  has_frame_ = true;
  last_frame_index_ = frame_index;
  ++frames_processed_;

  const TrackerUpdate upd = tracker_.update(frame_index, detections);

  // Tracks leaving the active set no longer occupy zones
  for (const auto id : upd.lost) {
    for (auto& z : zones_) z.release(id);
  }
  for (const auto id : upd.purged) {
    for (auto& l : lines_) l.forget(id);
    for (auto& z : zones_) z.release(id);
  }

  std::uint64_t events = 0;

  // Lines: previous and current center of every track sampled this frame
  for (const auto id : upd.sampled) {
    const Track* t = tracker_.find(id);
    if (!t || t->history.empty()) continue;

    const Point2f curr = t->latest().center;
    const Point2f prev = (t->history.size() >= 2) ? t->history[t->history.size() - 2].center : curr;

    for (auto& l : lines_) {
      const CrossingDirection dir = l.observe(t->id, t->class_id, prev, curr);
      if (dir == CrossingDirection::None) continue;
      ++events;
      if (counting_cfg_.log_events) log_crossing(frame_index, *t, l, dir);
    }
  }

  // Zones: current center of every active track
  for (const auto& v : upd.active) {
    for (auto& z : zones_) {
      const ZoneTransition tr = z.observe(v.id, v.class_id, v.center);
      if (tr == ZoneTransition::None) continue;
      ++events;
      if (counting_cfg_.log_events) {
        const Track* t = tracker_.find(v.id);
        if (t) log_zone(frame_index, *t, z, tr);
      }
    }
  }

  CountSnapshot s = snapshot();
  s.events = events;
  return s;
}

CountSnapshot CountingEngine::snapshot() const {
  CountSnapshot s;
  s.frame_index = last_frame_index_;
  s.lines.reserve(lines_.size());
  for (const auto& l : lines_) s.lines.push_back(l.counts());
  s.zones.reserve(zones_.size());
  for (const auto& z : zones_) s.zones.push_back(z.counts());
  s.tracks = tracker_.active_tracks();
  return s;
}

void CountingEngine::reset() {
  tracker_.reset();
  for (auto& l : lines_) l.reset_counts();
  for (auto& z : zones_) z.reset_counts();
  has_frame_ = false;
  last_frame_index_ = 0;
  faulted_ = false;
  frames_processed_ = 0;
}

void CountingEngine::log_crossing(std::uint64_t frame_index, const Track& t, const LineCounter& line, CrossingDirection dir) const {
  std::cout << "[frame " << frame_index << "] track " << t.id << " (" << GeneralClassName(t.class_id) << ") crossed "
            << line.definition().id << " " << (dir == CrossingDirection::In ? "in" : "out") << "\n";
}

void CountingEngine::log_zone(std::uint64_t frame_index, const Track& t, const ZoneCounter& zone, ZoneTransition tr) const {
  std::cout << "[frame " << frame_index << "] track " << t.id << " (" << GeneralClassName(t.class_id) << ") "
            << (tr == ZoneTransition::Entered ? "entered " : "exited ") << zone.definition().id << "\n";
}

} // namespace occ
