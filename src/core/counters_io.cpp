#include "core/counters_io.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include "core/labels/class_presets.hpp"

namespace occ {

static std::runtime_error CountersError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Counters error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static std::string Indexed(const std::string& key, std::size_t i) {
  return key + "[" + std::to_string(i) + "]";
}

template <typename T>
static T Required(const YAML::Node& parent, const char* key, const std::string& key_path) {
  const YAML::Node n = parent[key];
  if (!n) throw CountersError(key_path, "missing required key");
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw CountersError(key_path, e.what());
  }
}

template <typename T>
static T Optional(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = parent[key];
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw CountersError(key_path, e.what());
  }
}

static Point2f ParsePoint(const YAML::Node& n, const std::string& key_path) {
  if (!n || !n.IsSequence() || n.size() != 2) throw CountersError(key_path, "expected [x, y]");
  try {
    return Point2f{n[0].as<float>(), n[1].as<float>()};
  } catch (const YAML::Exception& e) {
    throw CountersError(key_path, e.what());
  }
}

// classes: all | none | common | [0, "car", 5]
static ClassFilter ParseClasses(const YAML::Node& parent, const std::string& key_path) {
  const YAML::Node n = parent["classes"];
  if (!n) return ClassFilter::All();

  if (n.IsScalar()) {
    std::string s = n.as<std::string>();
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "all") return ClassFilter::All();
    try {
      return ResolveClassPreset(s);
    } catch (const std::invalid_argument& e) {
      throw CountersError(key_path, e.what());
    }
  }

  if (!n.IsSequence()) throw CountersError(key_path, "expected a preset name or a list of class ids");

  std::set<int> ids;
  for (std::size_t i = 0; i < n.size(); ++i) {
    const YAML::Node item = n[i];
    const std::string ip = Indexed(key_path, i);
    if (!item.IsScalar()) throw CountersError(ip, "expected a class id or name");
    int id = -1;
    if (YAML::convert<int>::decode(item, id)) {
      if (id < 0) throw CountersError(ip, "class id must be >= 0");
      ids.insert(id);
      continue;
    }
    const auto by_name = ClassIdByName(item.as<std::string>());
    if (!by_name) throw CountersError(ip, "unknown class '" + item.as<std::string>() + "'");
    ids.insert(*by_name);
  }
  return ClassFilter::Only(std::move(ids));
}

static CounterDefinitions LoadFromRoot(const YAML::Node& root) {
  CounterDefinitions defs;
  if (!root || root.IsNull()) return defs;
  if (!root.IsMap()) throw CountersError("<root>", "expected a mapping");

  defs.width = Optional<int>(root, "width", "width", defs.width);
  defs.height = Optional<int>(root, "height", "height", defs.height);

  const YAML::Node lines = root["lines"];
  if (lines) {
    if (!lines.IsSequence()) throw CountersError("lines", "expected a list");
    for (std::size_t i = 0; i < lines.size(); ++i) {
      const YAML::Node ln = lines[i];
      const std::string p = Indexed("lines", i);
      if (!ln.IsMap()) throw CountersError(p, "expected a mapping");

      LineDefinition def;
      def.id = Required<std::string>(ln, "id", p + ".id");
      def.name = Optional<std::string>(ln, "name", p + ".name", def.id);
      def.start = ParsePoint(ln["start"], p + ".start");
      def.end = ParsePoint(ln["end"], p + ".end");
      def.classes = ParseClasses(ln, p + ".classes");
      ValidateLineOrThrow(def);
      defs.lines.push_back(std::move(def));
    }
  }

  const YAML::Node zones = root["zones"];
  if (zones) {
    if (!zones.IsSequence()) throw CountersError("zones", "expected a list");
    for (std::size_t i = 0; i < zones.size(); ++i) {
      const YAML::Node zn = zones[i];
      const std::string p = Indexed("zones", i);
      if (!zn.IsMap()) throw CountersError(p, "expected a mapping");

      ZoneDefinition def;
      def.id = Required<std::string>(zn, "id", p + ".id");
      def.name = Optional<std::string>(zn, "name", p + ".name", def.id);

      const YAML::Node pts = zn["points"];
      if (!pts || !pts.IsSequence()) throw CountersError(p + ".points", "expected a list of [x, y]");
      for (std::size_t k = 0; k < pts.size(); ++k) {
        def.points.push_back(ParsePoint(pts[k], Indexed(p + ".points", k)));
      }
      def.classes = ParseClasses(zn, p + ".classes");
      ValidateZoneOrThrow(def);
      defs.zones.push_back(std::move(def));
    }
  }

  return defs;
}

CounterDefinitions LoadCounterDefinitionsFromYamlFile(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load counters file '") + path + "': " + e.what());
  }
  return LoadFromRoot(root);
}

CounterDefinitions LoadCounterDefinitionsFromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse counters YAML: ") + e.what());
  }
  return LoadFromRoot(root);
}

static void EmitPoint(YAML::Emitter& out, const Point2f& p) {
  out << YAML::Flow << YAML::BeginSeq << p.x << p.y << YAML::EndSeq;
}

static void EmitClasses(YAML::Emitter& out, const ClassFilter& classes) {
  out << YAML::Key << "classes";
  if (classes.all) {
    out << YAML::Value << "all";
    return;
  }
  out << YAML::Value << YAML::Flow << YAML::BeginSeq;
  for (const int id : classes.ids) out << id;
  out << YAML::EndSeq;
}

std::string CounterDefinitionsToYamlString(const CounterDefinitions& defs) {
  YAML::Emitter out;
  out.SetFloatPrecision(9);

  out << YAML::BeginMap;
  out << YAML::Key << "width" << YAML::Value << defs.width;
  out << YAML::Key << "height" << YAML::Value << defs.height;

  out << YAML::Key << "lines" << YAML::Value << YAML::BeginSeq;
  for (const auto& l : defs.lines) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << l.id;
    out << YAML::Key << "name" << YAML::Value << l.name;
    out << YAML::Key << "start" << YAML::Value;
    EmitPoint(out, l.start);
    out << YAML::Key << "end" << YAML::Value;
    EmitPoint(out, l.end);
    EmitClasses(out, l.classes);
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  out << YAML::Key << "zones" << YAML::Value << YAML::BeginSeq;
  for (const auto& z : defs.zones) {
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << z.id;
    out << YAML::Key << "name" << YAML::Value << z.name;
    out << YAML::Key << "points" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& p : z.points) EmitPoint(out, p);
    out << YAML::EndSeq;
    EmitClasses(out, z.classes);
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;

  if (!out.good()) throw std::runtime_error(std::string("Failed to emit counters YAML: ") + out.GetLastError());
  return std::string(out.c_str()) + "\n";
}

void SaveCounterDefinitionsToYamlFile(const CounterDefinitions& defs, const std::string& path) {
  const std::string text = CounterDefinitionsToYamlString(defs);
  std::ofstream f(path);
  if (!f) throw std::runtime_error("Failed to open '" + path + "' for writing");
  f << text;
  if (!f) throw std::runtime_error("Failed to write counters file '" + path + "'");
}

} // namespace occ
