#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/*
  Pipeline counters, one StageMetrics per stage. A stage records every frame it finishes together with
  the detections that frame carried and, for the counting stage, the crossing and zone events it raised.
  The dashboard thread reads the fields while stages write them, hence the relaxed atomics.
*/

namespace occ {

std::uint64_t NowNs();

struct StageMetrics {
  explicit StageMetrics(std::string stage_name);

  std::string name;

  std::atomic<std::uint64_t> frames{0};
  std::atomic<std::uint64_t> detections{0};
  std::atomic<std::uint64_t> events{0};
  std::atomic<std::uint64_t> last_frame_index{0};

  std::atomic<std::uint64_t> work_ns_total{0};
  std::atomic<std::uint64_t> max_work_ns{0};
  std::atomic<std::uint64_t> last_frame_ns{0};   // NowNs() of the latest record, 0 before the first

  void on_frame(std::uint64_t frame_index, std::size_t detection_count, std::uint64_t work_ns, std::uint64_t event_count = 0);

  // Mean work time over every recorded frame
  std::uint64_t mean_work_ns() const;
};

class Metrics {
public:
  StageMetrics* add_stage(std::string name);

  const StageMetrics* find(const std::string& name) const;
  const std::vector<std::unique_ptr<StageMetrics>>& stages() const { return stages_; }

private:
  std::vector<std::unique_ptr<StageMetrics>> stages_;
};

} // namespace occ
