#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/count_snapshot.hpp"
#include "core/counter_definitions.hpp"
#include "core/detections.hpp"
#include "core/line_counter.hpp"
#include "core/tracker.hpp"
#include "core/zone_counter.hpp"

/*
    CountingEngine owns the tracker and every line/zone counter. Per frame it runs the tracker, feeds each
    track that got a new sample into every line (previous + current center) and every active track into
    every zone (current center), then settles tracks that went Lost or were purged.

    Not thread-safe. process() must be called with strictly increasing frame indices from one thread;
    definitions may change between process() calls only.
*/

namespace occ {

class CountingEngine {
public:
  explicit CountingEngine(TrackingConfig tracking, CountingConfig counting = {});

  CountingEngine(const CountingEngine&) = delete;
  CountingEngine& operator=(const CountingEngine&) = delete;

  // Definitions. Validation happens before any state changes
  void add_line(LineDefinition line);
  void add_zone(ZoneDefinition zone);
  void load_definitions(const CounterDefinitions& defs);
  void remove_counter(const std::string& id);
  void set_enabled_classes(const std::string& id, ClassFilter classes);
  bool has_counter(const std::string& id) const;

  std::vector<LineDefinition> line_definitions() const;
  std::vector<ZoneDefinition> zone_definitions() const;

  // Throws OutOfOrderFrame if frame_index does not increase, SessionFaulted on every call after that
  CountSnapshot process(std::uint64_t frame_index, const std::vector<Detection>& detections);
  CountSnapshot process(const Detections& detections) { return process(detections.source_frame_id, detections.items); }

  CountSnapshot snapshot() const;

  // Zero all counts and drop all tracks, keep definitions
  void reset();

  bool faulted() const { return faulted_; }
  std::uint64_t frames_processed() const { return frames_processed_; }

private:
  void ensure_unique(const std::string& id) const;
  void log_crossing(std::uint64_t frame_index, const Track& t, const LineCounter& line, CrossingDirection dir) const;
  void log_zone(std::uint64_t frame_index, const Track& t, const ZoneCounter& zone, ZoneTransition tr) const;

  CountingConfig counting_cfg_;
  IouTracker tracker_;
  std::vector<LineCounter> lines_;
  std::vector<ZoneCounter> zones_;

  bool has_frame_{false};
  std::uint64_t last_frame_index_{0};
  bool faulted_{false};
  std::uint64_t frames_processed_{0};
};

} // namespace occ
