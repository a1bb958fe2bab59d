#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

namespace occ {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

// Missing keys keep the default, present keys must convert cleanly
template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static YAML::Node Section(const YAML::Node& parent, const char* key, const std::string& key_path) {
  const YAML::Node n = Child(parent, key);
  if (n && !n.IsMap()) throw ConfigError(key_path, "expected a mapping");
  return n;
}

static DropPolicy ParseDropPolicyKey(const YAML::Node& parent, const char* key, const std::string& key_path, DropPolicy fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "drop_oldest") return DropPolicy::DropOldest;
  if (s == "drop_newest") return DropPolicy::DropNewest;
  if (s == "block") return DropPolicy::Block;
  throw ConfigError(key_path, "unknown drop_policy '" + s + "'. Use: drop_oldest | drop_newest | block");
}

static void LoadQueueConfig(const YAML::Node& qnode, const std::string& key_path, QueueConfig& out) {
  if (!qnode) return;
  out.capacity = GetOrKey<std::size_t>(qnode, "capacity", PathJoin(key_path, "capacity"), out.capacity);
  out.drop_policy = ParseDropPolicyKey(qnode, "drop_policy", PathJoin(key_path, "drop_policy"), out.drop_policy);
}

static void LoadTracking(const YAML::Node& root, TrackingConfig& cfg) {
  const std::string p = "tracking";
  const YAML::Node tr = Section(root, "tracking", p);
  if (!tr) return;

  cfg.iou_threshold = GetOrKey<float>(tr, "iou_threshold", PathJoin(p, "iou_threshold"), cfg.iou_threshold);
  cfg.max_missed_frames = GetOrKey<int>(tr, "max_missed_frames", PathJoin(p, "max_missed_frames"), cfg.max_missed_frames);
  cfg.purge_after_frames = GetOrKey<int>(tr, "purge_after_frames", PathJoin(p, "purge_after_frames"), cfg.purge_after_frames);
  cfg.max_history = GetOrKey<int>(tr, "max_history", PathJoin(p, "max_history"), cfg.max_history);
}

static void LoadCounting(const YAML::Node& root, CountingConfig& cfg) {
  const std::string p = "counting";
  const YAML::Node c = Section(root, "counting", p);
  if (!c) return;

  cfg.counters_path = GetOrKey<std::string>(c, "counters_path", PathJoin(p, "counters_path"), cfg.counters_path);
  cfg.log_events = GetOrKey<bool>(c, "log_events", PathJoin(p, "log_events"), cfg.log_events);
}

static void LoadReplay(const YAML::Node& root, ReplayConfig& cfg) {
  const std::string p = "replay";
  const YAML::Node r = Section(root, "replay", p);
  if (!r) return;

  cfg.detections_path = GetOrKey<std::string>(r, "detections_path", PathJoin(p, "detections_path"), cfg.detections_path);
  cfg.confidence_threshold = GetOrKey<float>(r, "confidence_threshold", PathJoin(p, "confidence_threshold"), cfg.confidence_threshold);
  cfg.frame_interval_ms = GetOrKey<int>(r, "frame_interval_ms", PathJoin(p, "frame_interval_ms"), cfg.frame_interval_ms);
}

static void LoadBuffering(const YAML::Node& root, BufferingConfig& cfg) {
  const std::string p = "buffering";
  const YAML::Node buf = Section(root, "buffering", p);
  if (!buf) return;

  const std::string qp = PathJoin(p, "queues");
  const YAML::Node qs = Section(buf, "queues", qp);
  if (qs) {
    const std::string dp = PathJoin(qp, "detection_to_counting");
    LoadQueueConfig(Section(qs, "detection_to_counting", dp), dp, cfg.queues.detection_to_counting);
  }
}

static void LoadVisualization(const YAML::Node& root, VisualizationConfig& cfg) {
  const std::string p = "visualization";
  const YAML::Node viz = Section(root, "visualization", p);
  if (!viz) return;

  cfg.enabled = GetOrKey<bool>(viz, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.width = GetOrKey<int>(viz, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(viz, "height", PathJoin(p, "height"), cfg.height);
  cfg.fps = GetOrKey<int>(viz, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.output_path = GetOrKey<std::string>(viz, "output_path", PathJoin(p, "output_path"), cfg.output_path);

  cfg.show_track_ids = GetOrKey<bool>(viz, "show_track_ids", PathJoin(p, "show_track_ids"), cfg.show_track_ids);
  cfg.show_labels = GetOrKey<bool>(viz, "show_labels", PathJoin(p, "show_labels"), cfg.show_labels);
}

static void LoadMetrics(const YAML::Node& root, MetricsConfig& cfg) {
  const std::string p = "metrics";
  const YAML::Node m = Section(root, "metrics", p);
  if (!m) return;

  cfg.enable_console_log = GetOrKey<bool>(m, "enable_console_log", PathJoin(p, "enable_console_log"), cfg.enable_console_log);
  cfg.log_interval_ms = GetOrKey<int>(m, "log_interval_ms", PathJoin(p, "log_interval_ms"), cfg.log_interval_ms);

  const std::string cp = PathJoin(p, "export_csv");
  const YAML::Node csv = Section(m, "export_csv", cp);
  if (csv) {
    cfg.export_csv.enabled = GetOrKey<bool>(csv, "enabled", PathJoin(cp, "enabled"), cfg.export_csv.enabled);
    cfg.export_csv.output_path = GetOrKey<std::string>(csv, "output_path", PathJoin(cp, "output_path"), cfg.export_csv.output_path);
  }
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.tracking.iou_threshold < 0.f || cfg.tracking.iou_threshold > 1.f)
    throw ConfigError("tracking.iou_threshold", "must be in [0, 1]");
  if (cfg.tracking.max_missed_frames < 0) throw ConfigError("tracking.max_missed_frames", "must be >= 0");
  if (cfg.tracking.purge_after_frames < 0) throw ConfigError("tracking.purge_after_frames", "must be >= 0");
  if (cfg.tracking.max_history < 0) throw ConfigError("tracking.max_history", "must be >= 0");
  if (cfg.tracking.max_history == 1)
    throw ConfigError("tracking.max_history", "must be 0 (unbounded) or >= 2, crossings need two samples");

  if (cfg.replay.confidence_threshold < 0.f || cfg.replay.confidence_threshold > 1.f)
    throw ConfigError("replay.confidence_threshold", "must be in [0, 1]");
  if (cfg.replay.frame_interval_ms < 0) throw ConfigError("replay.frame_interval_ms", "must be >= 0");

  if (cfg.buffering.queues.detection_to_counting.capacity < 1)
    throw ConfigError("buffering.queues.detection_to_counting.capacity", "must be >= 1");

  if (cfg.visualization.enabled) {
    if (cfg.visualization.width <= 0 || cfg.visualization.height <= 0)
      throw ConfigError("visualization", "width/height must be > 0 when enabled");
    if (cfg.visualization.fps <= 0) throw ConfigError("visualization.fps", "must be > 0 when enabled");
    if (cfg.visualization.output_path.empty())
      throw ConfigError("visualization.output_path", "required when visualization.enabled=true");
  }

  if (cfg.metrics.log_interval_ms <= 0) throw ConfigError("metrics.log_interval_ms", "must be > 0");
  if (cfg.metrics.export_csv.enabled && cfg.metrics.export_csv.output_path.empty())
    throw ConfigError("metrics.export_csv.output_path", "required when export_csv.enabled=true");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;
  if (root && !root.IsNull() && !root.IsMap()) throw ConfigError("<root>", "expected a mapping");

  LoadTracking(root, cfg.tracking);
  LoadCounting(root, cfg.counting);
  LoadReplay(root, cfg.replay);
  LoadBuffering(root, cfg.buffering);
  LoadVisualization(root, cfg.visualization);
  LoadMetrics(root, cfg.metrics);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

} // namespace occ
