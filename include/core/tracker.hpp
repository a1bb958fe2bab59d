#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "core/track.hpp"

namespace occ {

// What changed in one Tracker::update call
struct TrackerUpdate {
  std::vector<TrackView> active;        // Active tracks after this frame, ordered by id
  std::vector<std::uint64_t> sampled;   // Received a new sample this frame (matched or spawned)
  std::vector<std::uint64_t> lost;      // Went Active -> Lost this frame
  std::vector<std::uint64_t> purged;    // Deleted this frame
};

// Greedy IoU tracker. Each frame, same-class (track, detection) pairs are taken best-IoU first
// while IoU >= iou_threshold; leftovers spawn new tracks or count as misses.
class IouTracker {
public:
  explicit IouTracker(TrackingConfig cfg);

  TrackerUpdate update(std::uint64_t frame_index, const std::vector<Detection>& detections);

  // Active or Lost track by id, nullptr once purged
  const Track* find(std::uint64_t id) const;

  std::vector<TrackView> active_tracks() const;

  std::size_t size() const { return tracks_.size(); }

  void reset();

  const TrackingConfig& config() const { return cfg_; }

private:
  void append_sample(Track& t, std::uint64_t frame_index, const Detection& d);

  TrackingConfig cfg_;
  std::map<std::uint64_t, Track> tracks_; // Ordered by id keeps matching deterministic
  std::uint64_t next_id_{1};
};

TrackView MakeTrackView(const Track& t);

} // namespace occ
