#pragma once

#include <cstdint>
#include <vector>

namespace occ {

// Axis-aligned box in frame pixel coordinates, corners (x1, y1) top-left and (x2, y2) bottom-right
struct BBox {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};

  float width() const { return x2 - x1; }
  float height() const { return y2 - y1; }
};

// A singular Detection produced by the external detector, already filtered by confidence upstream
struct Detection {
  BBox bbox;
  std::int32_t class_id{-1};
  float confidence{0.f};
};

// One frame's worth of detections
struct Detections {
  std::uint64_t source_frame_id{0}; // Which frame this detection result belongs to
  std::vector<Detection> items;
};

} // namespace occ
