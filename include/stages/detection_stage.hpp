#pragma once

#include <cstdint>
#include <memory>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "core/detector.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace occ {

// Pulls frames from a Detector and hands them to the counting stage. Closes the queue at end of stream
class DetectionStage final : public Stage {
public:
  DetectionStage(StageMetrics* metrics, ReplayConfig cfg, std::unique_ptr<Detector> detector, std::shared_ptr<BoundedQueue<Detections>> out);
  ~DetectionStage() override;

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  StageMetrics* metrics_;
  ReplayConfig cfg_;
  std::unique_ptr<Detector> detector_;
  std::shared_ptr<BoundedQueue<Detections>> out_;
};

} // namespace occ
