#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/count_snapshot.hpp"
#include "infra/metrics.hpp"

namespace occ {

struct QueueView {
  std::string name;
  std::function<std::size_t()> size_fn;
  std::function<std::size_t()> cap_fn;
  std::function<std::uint64_t()> drops_fn;
};

// Redraws stage throughput and events, queue fill and per-counter totals in place on an ANSI terminal
class AnsiDashboard {
public:
  AnsiDashboard(const Metrics& metrics, std::vector<QueueView> queues, std::ostream& out);

  // Draw one refresh. Rates are computed against the previous draw call
  void draw(const CountSnapshot& snapshot);

private:
  const Metrics& metrics_;
  std::vector<QueueView> queues_;
  std::ostream& out_;

  bool first_{true};
  std::chrono::steady_clock::time_point last_{};

  struct Prev { std::uint64_t frames{0}; std::uint64_t detections{0}; std::uint64_t work_ns{0}; };
  std::unordered_map<const StageMetrics*, Prev> prev_stage_;
  std::unordered_map<std::string, std::uint64_t> prev_qdrops_;
};

} // namespace occ
