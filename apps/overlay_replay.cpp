#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/config_loader.hpp"
#include "core/counters_io.hpp"
#include "core/counting_engine.hpp"
#include "core/replay_detector.hpp"
#include "core/stats_export.hpp"

#include "apps/count_overlay.hpp"

// overlay_replay.cpp is a debugging tool
// Replays recorded detections through the engine on one thread and records the overlay
// (zones, lines, tracks, counts) over a blank canvas of the configured size

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    occ::AppConfig cfg = occ::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    occ::CounterDefinitions defs = occ::LoadCounterDefinitionsFromYamlFile(cfg.counting.counters_path);
    if (defs.width > 0 && defs.height > 0) {
      occ::ScaleCounterDefinitions(defs, cfg.visualization.width, cfg.visualization.height);
    }

    occ::ReplayDetector detector = occ::ReplayDetector::FromYamlFile(cfg.replay.detections_path, cfg.replay.confidence_threshold);

    occ::CountingEngine engine(cfg.tracking, cfg.counting);
    engine.load_definitions(defs);

    occ::CountOverlay overlay(cfg.visualization);

    cv::VideoWriter writer;
    if (cfg.visualization.enabled) {
      const cv::Size size(cfg.visualization.width, cfg.visualization.height);
      writer.open(cfg.visualization.output_path, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), cfg.visualization.fps, size);
      if (!writer.isOpened()) {
        std::cerr << "Failed to open video writer: " << cfg.visualization.output_path << "\n";
        return 1;
      }
    }

    occ::Detections d;
    occ::CountSnapshot snap = engine.snapshot();
    while (detector.next(d)) {
      snap = engine.process(d);

      if (writer.isOpened()) {
        cv::Mat canvas = cv::Mat::zeros(cfg.visualization.height, cfg.visualization.width, CV_8UC3);
        overlay.draw(canvas, engine.line_definitions(), engine.zone_definitions(), snap);
        writer.write(canvas);
      }
    }

    if (writer.isOpened()) {
      writer.release();
      std::cout << "Overlay written: " << cfg.visualization.output_path << "\n";
    }

    std::cout << "Processed " << engine.frames_processed() << " frame(s)\n" << occ::FormatCountSummary(snap);

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
