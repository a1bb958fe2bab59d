#pragma once
#include <cstddef>
#include <string>

namespace occ {

enum class DropPolicy {
  DropOldest,
  DropNewest,
  Block        // Producer waits for space, used for lossless replay
};

struct QueueConfig {
  std::size_t capacity = 8;
  DropPolicy drop_policy = DropPolicy::Block;
};

struct QueuesConfig {
  QueueConfig detection_to_counting{};
};

struct BufferingConfig {
  QueuesConfig queues{};
};

struct TrackingConfig {
  float iou_threshold = 0.3f;
  int max_missed_frames = 30;
  int purge_after_frames = 30;
  int max_history = 0; // 0 keeps every sample
};

struct CountingConfig {
  std::string counters_path = "configs/counters.yaml";
  bool log_events = false;
};

struct ReplayConfig {
  std::string detections_path = "data/crossing_demo.yaml";
  float confidence_threshold = 0.0f;
  int frame_interval_ms = 0; // 0 = as fast as the pipeline drains
};

struct VisualizationConfig {
  bool enabled = false;
  int width = 1280;
  int height = 720;
  int fps = 30;
  std::string output_path = "overlay.mp4";

  bool show_track_ids = true;
  bool show_labels = true;
};

struct CsvExportConfig {
  bool enabled = false;
  std::string output_path = "stats.csv";
};

struct MetricsConfig {
  bool enable_console_log = true;
  int log_interval_ms = 300;
  CsvExportConfig export_csv{};
};

struct AppConfig {
  TrackingConfig tracking{};
  CountingConfig counting{};
  ReplayConfig replay{};
  BufferingConfig buffering{};
  VisualizationConfig visualization{};
  MetricsConfig metrics{};
};

}
