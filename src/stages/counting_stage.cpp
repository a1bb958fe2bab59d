#include "stages/counting_stage.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace occ {

CountingStage::CountingStage(StageMetrics* metrics, std::unique_ptr<CountingEngine> engine, std::shared_ptr<BoundedQueue<Detections>> in, std::shared_ptr<LatestStore<CountSnapshot>> out)
    : Stage("counting_stage"), metrics_(metrics), engine_(std::move(engine)), in_(std::move(in)), out_(std::move(out))
{
    if (!engine_) throw std::invalid_argument("CountingStage requires an engine");
}

CountingStage::~CountingStage() { stop(); }

void CountingStage::run(const StopToken& global, const std::atomic_bool& local) {
    using namespace std::chrono_literals;

    // Publish the empty state so readers see every counter before the first frame
    out_->write(engine_->snapshot());

    while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
        Detections d;
        if (!in_->try_pop_for(d, 25ms)) {
            if (in_->finished()) return;
            continue;
        }

        const auto t0 = std::chrono::steady_clock::now();

        // OutOfOrderFrame propagates and fails the stage, the session cannot continue
        CountSnapshot snap = engine_->process(d);
        const std::uint64_t events = snap.events;
        out_->write(std::move(snap));

        const auto work_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();
        if (metrics_) metrics_->on_frame(d.source_frame_id, d.items.size(), static_cast<std::uint64_t>(work_ns), events);
    }
}

} // namespace occ
