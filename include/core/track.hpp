#pragma once

#include <cstdint>
#include <deque>

#include "core/detections.hpp"
#include "core/geometry.hpp"

namespace occ {

enum class TrackState {
  Active,
  Lost   // No longer matched or reported, kept until purged so counters can settle
};

struct TrackSample {
  std::uint64_t frame_index{0};
  Point2f center;
  BBox bbox;
};

struct Track {
  std::uint64_t id{0};
  int class_id{-1};
  float confidence{0.f};

  TrackState state{TrackState::Active};
  int missed_frames{0};

  // Append-only, frame_index strictly increasing. Oldest samples may be dropped when bounded
  std::deque<TrackSample> history;

  const TrackSample& latest() const { return history.back(); }
  std::uint64_t last_update_frame_id() const { return history.empty() ? 0 : history.back().frame_index; }
};

// Read-only view handed to consumers (overlay, dashboard)
struct TrackView {
  std::uint64_t id{0};
  int class_id{-1};
  float confidence{0.f};
  BBox bbox;
  Point2f center;
  int missed_frames{0};
};

} // namespace occ
