#include "stages/detection_stage.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <thread>

namespace occ {

DetectionStage::DetectionStage(StageMetrics* metrics, ReplayConfig cfg, std::unique_ptr<Detector> detector, std::shared_ptr<BoundedQueue<Detections>> out)
    : Stage("detection_stage"), metrics_(metrics), cfg_(std::move(cfg)), detector_(std::move(detector)), out_(std::move(out))
{
    if (!detector_) throw std::invalid_argument("DetectionStage requires a detector");
}

DetectionStage::~DetectionStage() { stop(); }

void DetectionStage::run(const StopToken& global, const std::atomic_bool& local) {
    using namespace std::chrono_literals;

    auto stopping = [&] { return global.stop_requested() || local.load(std::memory_order_relaxed); };

    while (!stopping()) {
        const auto t0 = std::chrono::steady_clock::now();

        Detections d;
        if (!detector_->next(d)) {
            // End of stream, let the consumer drain and finish
            out_->close();
            return;
        }

        const auto work_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();
        if (metrics_) metrics_->on_frame(d.source_frame_id, d.items.size(), static_cast<std::uint64_t>(work_ns));

        // Under Block policy keep retrying so replay is lossless, but stay responsive to stop requests
        if (out_->policy() == DropPolicy::Block) {
            while (!stopping() && !out_->push_for(d, 50ms)) {
                if (out_->closed()) return;
            }
        } else {
            out_->try_push(std::move(d));
        }

        if (cfg_.frame_interval_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.frame_interval_ms));
    }
}

} // namespace occ
