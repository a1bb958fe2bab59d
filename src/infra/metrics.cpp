#include "infra/metrics.hpp"

#include <chrono>
#include <utility>

namespace occ {

std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now().time_since_epoch()).count());
}

StageMetrics::StageMetrics(std::string stage_name) : name(std::move(stage_name)) {}

void StageMetrics::on_frame(std::uint64_t frame_index, std::size_t detection_count, std::uint64_t work_ns, std::uint64_t event_count) {
  frames.fetch_add(1, std::memory_order_relaxed);
  detections.fetch_add(detection_count, std::memory_order_relaxed);
  events.fetch_add(event_count, std::memory_order_relaxed);
  last_frame_index.store(frame_index, std::memory_order_relaxed);

  work_ns_total.fetch_add(work_ns, std::memory_order_relaxed);
  auto prev_max = max_work_ns.load(std::memory_order_relaxed);
  while (work_ns > prev_max && !max_work_ns.compare_exchange_weak(prev_max, work_ns, std::memory_order_relaxed)) {
  }

  last_frame_ns.store(NowNs(), std::memory_order_relaxed);
}

std::uint64_t StageMetrics::mean_work_ns() const {
  const auto n = frames.load(std::memory_order_relaxed);
  return n == 0 ? 0 : work_ns_total.load(std::memory_order_relaxed) / n;
}

StageMetrics* Metrics::add_stage(std::string name) {
  stages_.push_back(std::make_unique<StageMetrics>(std::move(name)));
  return stages_.back().get();
}

const StageMetrics* Metrics::find(const std::string& name) const {
  for (const auto& s : stages_) {
    if (s->name == name) return s.get();
  }
  return nullptr;
}

} // namespace occ
