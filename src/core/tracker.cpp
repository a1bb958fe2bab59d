#include "core/tracker.hpp"

#include <algorithm>
#include <utility>

namespace occ {

TrackView MakeTrackView(const Track& t) {
  TrackView v;
  v.id = t.id;
  v.class_id = t.class_id;
  v.confidence = t.confidence;
  v.missed_frames = t.missed_frames;
  if (!t.history.empty()) {
    v.bbox = t.latest().bbox;
    v.center = t.latest().center;
  }
  return v;
}

IouTracker::IouTracker(TrackingConfig cfg) : cfg_(std::move(cfg)) {}

void IouTracker::append_sample(Track& t, std::uint64_t frame_index, const Detection& d) {
  TrackSample s;
  s.frame_index = frame_index;
  s.bbox = d.bbox;
  s.center = Center(d.bbox);
  t.history.push_back(s);
  t.confidence = d.confidence;
  t.missed_frames = 0;

  if (cfg_.max_history > 0) {
    while (t.history.size() > static_cast<std::size_t>(cfg_.max_history)) t.history.pop_front();
  }
}

TrackerUpdate IouTracker::update(std::uint64_t frame_index, const std::vector<Detection>& detections) {
  TrackerUpdate out;

  // Frames a Lost track is kept after it went Lost
  const int lost_at = cfg_.max_missed_frames + 1;
  auto lost_expired = [&](const Track& t) { return t.missed_frames - lost_at >= cfg_.purge_after_frames; };

  // Age tracks that were already Lost before this frame
  for (auto it = tracks_.begin(); it != tracks_.end();) {
    Track& t = it->second;
    if (t.state == TrackState::Lost) {
      ++t.missed_frames;
      if (lost_expired(t)) {
        out.purged.push_back(t.id);
        it = tracks_.erase(it);
        continue;
      }
    }
    ++it;
  }

  // Score every same-class (track, detection) pair that clears the threshold
  struct Candidate { float iou; std::uint64_t track_id; std::size_t det_idx; };
  std::vector<Candidate> cands;

  for (const auto& kv : tracks_) {
    const Track& t = kv.second;
    if (t.state != TrackState::Active || t.history.empty()) continue;
    for (std::size_t j = 0; j < detections.size(); ++j) {
      if (detections[j].class_id != t.class_id) continue;
      const float iou = IoU(t.latest().bbox, detections[j].bbox);
      if (iou >= cfg_.iou_threshold && iou > 0.f) cands.push_back({iou, t.id, j});
    }
  }

  // Highest IoU first; ties go to the older track, then the earlier detection
  std::sort(cands.begin(), cands.end(), [](const Candidate& a, const Candidate& b) {
    if (a.iou != b.iou) return a.iou > b.iou;
    if (a.track_id != b.track_id) return a.track_id < b.track_id;
    return a.det_idx < b.det_idx;
  });

  std::vector<bool> det_used(detections.size(), false);
  std::map<std::uint64_t, bool> track_used;

  for (const auto& c : cands) {
    if (det_used[c.det_idx] || track_used[c.track_id]) continue;
    det_used[c.det_idx] = true;
    track_used[c.track_id] = true;

    append_sample(tracks_.at(c.track_id), frame_index, detections[c.det_idx]);
    out.sampled.push_back(c.track_id);
  }

  // Unmatched Active tracks
  for (auto it = tracks_.begin(); it != tracks_.end();) {
    Track& t = it->second;
    if (t.state == TrackState::Active && !track_used[t.id]) {
      ++t.missed_frames;
      if (t.missed_frames > cfg_.max_missed_frames) {
        t.state = TrackState::Lost;
        out.lost.push_back(t.id);
        if (lost_expired(t)) {
          out.purged.push_back(t.id);
          it = tracks_.erase(it);
          continue;
        }
      }
    }
    ++it;
  }

  // Unmatched detections spawn new tracks
  for (std::size_t j = 0; j < detections.size(); ++j) {
    if (det_used[j]) continue;
    Track t;
    t.id = next_id_++;
    t.class_id = detections[j].class_id;
    append_sample(t, frame_index, detections[j]);
    out.sampled.push_back(t.id);
    tracks_.emplace(t.id, std::move(t));
  }

  std::sort(out.sampled.begin(), out.sampled.end());
  out.active = active_tracks();
  return out;
}

const Track* IouTracker::find(std::uint64_t id) const {
  auto it = tracks_.find(id);
  return it == tracks_.end() ? nullptr : &it->second;
}

std::vector<TrackView> IouTracker::active_tracks() const {
  std::vector<TrackView> v;
  v.reserve(tracks_.size());
  for (const auto& kv : tracks_) {
    if (kv.second.state == TrackState::Active) v.push_back(MakeTrackView(kv.second));
  }
  return v;
}

void IouTracker::reset() {
  tracks_.clear();
  next_id_ = 1;
}

} // namespace occ
