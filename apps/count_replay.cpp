#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

// Utilities
#include "core/config_loader.hpp"
#include "core/counters_io.hpp"
#include "core/counting_engine.hpp"
#include "core/replay_detector.hpp"
#include "core/stats_export.hpp"

#include "infra/stop_token.hpp"

// Resources
#include "infra/bounded_queue.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"

// Stages
#include "stages/detection_stage.hpp"
#include "stages/counting_stage.hpp"

#include "apps/ansi_dashboard.hpp"

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// count_replay.cpp runs the full pipeline on recorded detections:
// detection stage -> bounded queue -> counting stage -> latest snapshot -> dashboard

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    occ::AppConfig cfg = occ::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    const occ::CounterDefinitions defs = occ::LoadCounterDefinitionsFromYamlFile(cfg.counting.counters_path);
    std::cout << "Loaded " << defs.lines.size() << " line(s), " << defs.zones.size() << " zone(s) from "
              << cfg.counting.counters_path << "\n";

    auto detector = std::make_unique<occ::ReplayDetector>(
        occ::ReplayDetector::FromYamlFile(cfg.replay.detections_path, cfg.replay.confidence_threshold));
    std::cout << "Loaded " << detector->frame_count() << " frame(s) from " << cfg.replay.detections_path << "\n";

    auto engine = std::make_unique<occ::CountingEngine>(cfg.tracking, cfg.counting);
    engine->load_definitions(defs);

    std::signal(SIGINT, HandleSigint);

    occ::StopSource global_stop;
    occ::Metrics metrics;

    // Resources shared between stages
    const auto& qcfg = cfg.buffering.queues.detection_to_counting;
    auto detection_to_counting_queue = std::make_shared<occ::BoundedQueue<occ::Detections>>(qcfg.capacity, qcfg.drop_policy);
    auto snapshot_latest_store = std::make_shared<occ::LatestStore<occ::CountSnapshot>>();

    occ::DetectionStage detection_stage(metrics.add_stage("detection"), cfg.replay, std::move(detector), detection_to_counting_queue);
    occ::CountingStage counting_stage(metrics.add_stage("counting"), std::move(engine), detection_to_counting_queue, snapshot_latest_store);

    std::vector<occ::QueueView> queues;
    queues.push_back({"detection_to_counting",
                      [q = detection_to_counting_queue] { return q->size(); },
                      [q = detection_to_counting_queue] { return q->capacity(); },
                      [q = detection_to_counting_queue] { return q->drops_total(); }});
    occ::AnsiDashboard dashboard(metrics, queues, std::cout);

    // Consumers first
    counting_stage.start(global_stop);
    detection_stage.start(global_stop);

    auto last_draw = std::chrono::steady_clock::now();

    // A failing stage requests the stop itself
    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        global_stop.request_stop("interrupted");
        break;
      }

      // Counting finishes once the detection stream closed and the queue drained
      if (counting_stage.finished()) {
        global_stop.request_stop("replay complete");
        break;
      }

      const auto now = std::chrono::steady_clock::now();
      if (cfg.metrics.enable_console_log && now - last_draw >= std::chrono::milliseconds(cfg.metrics.log_interval_ms)) {
        last_draw = now;
        if (auto snap = snapshot_latest_store->read_latest()) dashboard.draw(*snap);
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    std::cout << "\nShutting down pipeline: " << global_stop.reason() << std::endl;

    // Stop all stages, producers first
    detection_stage.stop();
    counting_stage.stop();
    const bool failed = detection_stage.failed() || counting_stage.failed();

    const auto final_snap = snapshot_latest_store->read_latest();
    if (final_snap) {
      std::cout << "\nFinal counts at frame " << final_snap->frame_index << ":\n" << occ::FormatCountSummary(*final_snap);

      if (cfg.metrics.export_csv.enabled) {
        occ::WriteCountsCsvFile(*final_snap, cfg.metrics.export_csv.output_path);
        std::cout << "Stats exported: " << cfg.metrics.export_csv.output_path << "\n";
      }
    }

    if (failed) return 1;

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
