#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/detector.hpp"

namespace occ {

// Plays back detections recorded to YAML:
//
//   frames:
//     - frame: 1
//       detections:
//         - { class_id: 0, confidence: 0.91, bbox: [x1, y1, x2, y2] }
//
// Frames must be listed with strictly increasing indices. Items below the
// confidence threshold are dropped here, the counting engine never re-filters.
class ReplayDetector final : public Detector {
public:
  static ReplayDetector FromYamlFile(const std::string& path, float confidence_threshold);
  static ReplayDetector FromYamlString(const std::string& yaml, float confidence_threshold);

  bool next(Detections& out) override;
  void rewind() override { cursor_ = 0; }

  std::size_t frame_count() const { return frames_.size(); }

private:
  ReplayDetector(std::vector<Detections> frames, float confidence_threshold);

  std::vector<Detections> frames_;
  float confidence_threshold_{0.f};
  std::size_t cursor_{0};
};

} // namespace occ
