#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/counting_engine.hpp"
#include "core/replay_detector.hpp"
#include "infra/bounded_queue.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "stages/counting_stage.hpp"
#include "stages/detection_stage.hpp"

#include "check.hpp"

using namespace std::chrono_literals;

static const char* kCrossing = R"(
frames:
  - { frame: 1, detections: [ { class_id: 0, confidence: 0.9, bbox: [20, -20, 80, 40] } ] }
  - { frame: 2, detections: [ { class_id: 0, confidence: 0.9, bbox: [20, 0, 80, 60] } ] }
  - { frame: 3, detections: [ { class_id: 0, confidence: 0.9, bbox: [20, 20, 80, 80] } ] }
  - { frame: 4, detections: [ { class_id: 0, confidence: 0.9, bbox: [20, 40, 80, 100] } ] }
  - { frame: 5, detections: [ { class_id: 0, confidence: 0.9, bbox: [20, 60, 80, 120] } ] }
)";

// Hands out a fixed list of frames as given, ordering included
class ListDetector final : public occ::Detector {
public:
  explicit ListDetector(std::vector<occ::Detections> frames) : frames_(std::move(frames)) {}

  bool next(occ::Detections& out) override {
    if (cursor_ >= frames_.size()) return false;
    out = frames_[cursor_++];
    return true;
  }

  void rewind() override { cursor_ = 0; }

private:
  std::vector<occ::Detections> frames_;
  std::size_t cursor_{0};
};

static std::unique_ptr<occ::CountingEngine> MakeEngine() {
  auto engine = std::make_unique<occ::CountingEngine>(occ::TrackingConfig{});
  occ::LineDefinition line;
  line.id = "line_1";
  line.name = "Line 1";
  line.start = {0.f, 50.f};
  line.end = {100.f, 50.f};
  engine->add_line(line);
  return engine;
}

static bool WaitFinished(const occ::Stage& stage) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (!stage.finished()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

static void TestReplayThroughStages() {
  occ::StopSource global_stop;
  occ::Metrics metrics;

  // Capacity 1 with Block forces the producer to wait on the consumer
  auto queue = std::make_shared<occ::BoundedQueue<occ::Detections>>(1, occ::DropPolicy::Block);
  auto store = std::make_shared<occ::LatestStore<occ::CountSnapshot>>();

  auto detector = std::make_unique<occ::ReplayDetector>(occ::ReplayDetector::FromYamlString(kCrossing, 0.5f));
  occ::DetectionStage detection(metrics.add_stage("detection"), occ::ReplayConfig{}, std::move(detector), queue);
  occ::CountingStage counting(metrics.add_stage("counting"), MakeEngine(), queue, store);

  counting.start(global_stop);
  detection.start(global_stop);

  OCC_CHECK(WaitFinished(counting));
  OCC_CHECK(!counting.failed());
  OCC_CHECK(detection.finished());

  OCC_CHECK(!global_stop.stop_requested());
  OCC_CHECK(global_stop.reason().empty());

  detection.stop();
  counting.stop();

  const auto snap = store->read_latest();
  OCC_CHECK(snap.has_value());
  if (snap) {
    OCC_CHECK(occ::test::Eq(snap->frame_index, 5u));
    OCC_CHECK(occ::test::Eq(snap->line("line_1")->of(0).in, 1));
    OCC_CHECK(occ::test::Eq(snap->line("line_1")->of(0).out, 0));
  }
  OCC_CHECK(occ::test::Eq(queue->drops_total(), 0u));

  // One record per replayed frame on both stages; the single crossing is the only counting event
  const occ::StageMetrics* detected = metrics.find("detection");
  const occ::StageMetrics* counted = metrics.find("counting");
  OCC_CHECK(detected != nullptr && counted != nullptr);
  if (detected && counted) {
    OCC_CHECK(occ::test::Eq(detected->frames.load(), 5u));
    OCC_CHECK(occ::test::Eq(detected->detections.load(), 5u));
    OCC_CHECK(occ::test::Eq(detected->events.load(), 0u));
    OCC_CHECK(occ::test::Eq(counted->frames.load(), 5u));
    OCC_CHECK(occ::test::Eq(counted->detections.load(), 5u));
    OCC_CHECK(occ::test::Eq(counted->events.load(), 1u));
    OCC_CHECK(occ::test::Eq(counted->last_frame_index.load(), 5u));
    OCC_CHECK(counted->max_work_ns.load() >= counted->mean_work_ns());
  }
}

static void TestOutOfOrderFailsStage() {
  occ::StopSource global_stop;
  occ::Metrics metrics;

  std::vector<occ::Detections> frames(2);
  frames[0].source_frame_id = 2;
  frames[1].source_frame_id = 1;

  auto queue = std::make_shared<occ::BoundedQueue<occ::Detections>>(4, occ::DropPolicy::Block);
  auto store = std::make_shared<occ::LatestStore<occ::CountSnapshot>>();

  occ::DetectionStage detection(metrics.add_stage("detection"), occ::ReplayConfig{},
                                std::make_unique<ListDetector>(frames), queue);
  occ::CountingStage counting(metrics.add_stage("counting"), MakeEngine(), queue, store);

  counting.start(global_stop);
  detection.start(global_stop);

  OCC_CHECK(WaitFinished(counting));
  OCC_CHECK(counting.failed());
  OCC_CHECK(counting.error().find("Frame 1") != std::string::npos);

  // The failing stage stopped the pipeline and named itself
  OCC_CHECK(global_stop.stop_requested());
  OCC_CHECK(global_stop.reason().find("counting_stage failed") != std::string::npos);
  global_stop.request_stop("late request");
  OCC_CHECK(global_stop.reason().find("counting_stage failed") != std::string::npos);

  detection.stop();
  counting.stop();

  // Last good snapshot is still readable
  OCC_CHECK(occ::test::Eq(store->read_latest()->frame_index, 2u));
}

int main() {
  TestReplayThroughStages();
  TestOutOfOrderFailsStage();
  return occ::test::Finish("pipeline_test");
}
