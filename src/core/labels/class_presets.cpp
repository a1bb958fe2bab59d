#include "core/labels/class_presets.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include "core/labels/general_labels.hpp"

namespace occ {

static std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::optional<int> ClassIdByName(const std::string& name) {
  const std::string key = Lower(name);
  const auto& labels = GeneralLabels();
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] == key) return static_cast<int>(i);
  }
  return std::nullopt;
}

ClassFilter ResolveClassPreset(const std::string& preset) {
  const std::string p = Lower(preset);

  if (p == "all") {
    std::set<int> ids;
    for (int i = 0; i < static_cast<int>(GeneralLabels().size()); ++i) ids.insert(i);
    return ClassFilter::Only(std::move(ids));
  }
  if (p == "none") return ClassFilter::None();
  if (p == "common") {
    static const std::vector<std::string> common = {"person", "car", "truck", "bus", "motorcycle", "bicycle", "dog", "cat"};
    std::set<int> ids;
    for (const auto& n : common) {
      const auto id = ClassIdByName(n);
      if (id) ids.insert(*id);
    }
    return ClassFilter::Only(std::move(ids));
  }

  throw std::invalid_argument("unknown class preset '" + preset + "'. Use: ALL | NONE | COMMON");
}

} // namespace occ
