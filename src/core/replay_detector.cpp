#include "core/replay_detector.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>
#include <utility>

namespace occ {

static std::runtime_error ReplayError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Replay error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

template <typename T>
static T As(const YAML::Node& n, const std::string& key_path) {
  if (!n) throw ReplayError(key_path, "missing required key");
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ReplayError(key_path, e.what());
  }
}

static std::vector<Detections> ParseFrames(const YAML::Node& root) {
  if (!root || !root.IsMap()) throw ReplayError("<root>", "expected a mapping with a 'frames' list");
  const YAML::Node frames = root["frames"];
  if (!frames || !frames.IsSequence()) throw ReplayError("frames", "expected a list");

  std::vector<Detections> out;
  out.reserve(frames.size());

  for (std::size_t i = 0; i < frames.size(); ++i) {
    const std::string fp = "frames[" + std::to_string(i) + "]";
    const YAML::Node fn = frames[i];
    if (!fn.IsMap()) throw ReplayError(fp, "expected a mapping");

    Detections d;
    d.source_frame_id = As<std::uint64_t>(fn["frame"], fp + ".frame");
    if (!out.empty() && d.source_frame_id <= out.back().source_frame_id)
      throw ReplayError(fp + ".frame", "frame indices must strictly increase");

    const YAML::Node items = fn["detections"];
    if (items) {
      if (!items.IsSequence()) throw ReplayError(fp + ".detections", "expected a list");
      for (std::size_t k = 0; k < items.size(); ++k) {
        const std::string dp = fp + ".detections[" + std::to_string(k) + "]";
        const YAML::Node it = items[k];

        Detection det;
        det.class_id = As<std::int32_t>(it["class_id"], dp + ".class_id");
        det.confidence = it["confidence"] ? As<float>(it["confidence"], dp + ".confidence") : 1.f;

        const auto box = As<std::vector<float>>(it["bbox"], dp + ".bbox");
        if (box.size() != 4) throw ReplayError(dp + ".bbox", "expected [x1, y1, x2, y2]");
        det.bbox = BBox{box[0], box[1], box[2], box[3]};
        if (det.bbox.x2 < det.bbox.x1 || det.bbox.y2 < det.bbox.y1)
          throw ReplayError(dp + ".bbox", "x2/y2 must not be less than x1/y1");

        d.items.push_back(det);
      }
    }
    out.push_back(std::move(d));
  }
  return out;
}

ReplayDetector::ReplayDetector(std::vector<Detections> frames, float confidence_threshold)
    : frames_(std::move(frames)), confidence_threshold_(confidence_threshold) {}

ReplayDetector ReplayDetector::FromYamlFile(const std::string& path, float confidence_threshold) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load detections file '") + path + "': " + e.what());
  }
  return ReplayDetector(ParseFrames(root), confidence_threshold);
}

ReplayDetector ReplayDetector::FromYamlString(const std::string& yaml, float confidence_threshold) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse detections YAML: ") + e.what());
  }
  return ReplayDetector(ParseFrames(root), confidence_threshold);
}

bool ReplayDetector::next(Detections& out) {
  if (cursor_ >= frames_.size()) return false;

  const Detections& src = frames_[cursor_++];
  out.source_frame_id = src.source_frame_id;
  out.items.clear();
  for (const auto& d : src.items) {
    if (d.confidence >= confidence_threshold_) out.items.push_back(d);
  }
  return true;
}

} // namespace occ
