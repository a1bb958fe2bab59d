#include <iostream>
#include <string>

#include "core/counters_io.hpp"
#include "core/labels/general_labels.hpp"

// counters_info.cpp prints a summary of a counters file.
// With a target size and output path it also rescales the geometry and saves it:
//   counters_info configs/counters.yaml [width height out.yaml]

static std::string ClassesText(const occ::ClassFilter& f) {
  if (f.all) return "all";
  if (f.ids.empty()) return "none";
  std::string s;
  for (const int id : f.ids) {
    if (!s.empty()) s += ", ";
    s += occ::GeneralClassName(id);
  }
  return s;
}

int main(int argc, char** argv) {
  const std::string path = (argc > 1) ? argv[1] : "configs/counters.yaml";

  try {
    occ::CounterDefinitions defs = occ::LoadCounterDefinitionsFromYamlFile(path);

    std::cout << "Canvas Size: " << defs.width << "x" << defs.height << "\n";
    std::cout << "Lines: " << defs.lines.size() << "\n";
    for (const auto& l : defs.lines) {
      std::cout << "  - " << l.name << " [" << l.id << "]: (" << l.start.x << ", " << l.start.y << ") -> ("
                << l.end.x << ", " << l.end.y << ")  classes: " << ClassesText(l.classes) << "\n";
    }
    std::cout << "Zones: " << defs.zones.size() << "\n";
    for (const auto& z : defs.zones) {
      std::cout << "  - " << z.name << " [" << z.id << "]: " << z.points.size() << " points  classes: "
                << ClassesText(z.classes) << "\n";
    }

    if (argc > 4) {
      const int width = std::stoi(argv[2]);
      const int height = std::stoi(argv[3]);
      occ::ScaleCounterDefinitions(defs, width, height);
      occ::SaveCounterDefinitionsToYamlFile(defs, argv[4]);
      std::cout << "Rescaled to " << width << "x" << height << ", saved: " << argv[4] << "\n";
    }

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
