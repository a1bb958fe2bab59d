#pragma once

#include <memory>

#include "core/count_snapshot.hpp"
#include "core/counting_engine.hpp"
#include "core/detections.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "stages/stage.hpp"

namespace occ {

// The only thread that touches the engine. Publishes a CountSnapshot after every frame
class CountingStage final : public Stage {
public:
  CountingStage(StageMetrics* metrics, std::unique_ptr<CountingEngine> engine, std::shared_ptr<BoundedQueue<Detections>> in, std::shared_ptr<LatestStore<CountSnapshot>> out);
  ~CountingStage() override;

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  StageMetrics* metrics_;
  std::unique_ptr<CountingEngine> engine_;
  std::shared_ptr<BoundedQueue<Detections>> in_;
  std::shared_ptr<LatestStore<CountSnapshot>> out_;
};

} // namespace occ
