#pragma once

#include "core/detections.hpp"

namespace occ {

// Source of per-frame detections. The neural network itself lives behind this seam;
// implementations apply their own confidence filtering before handing items out.
class Detector {
public:
  virtual ~Detector() = default;

  // Fill 'out' with the next frame. Returns false at end of stream
  virtual bool next(Detections& out) = 0;

  // Start over from the first frame, if the source supports it
  virtual void rewind() = 0;
};

} // namespace occ
