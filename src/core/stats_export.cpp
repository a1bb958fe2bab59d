#include "core/stats_export.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "core/labels/general_labels.hpp"

namespace occ {

// Quote fields that would break the row
static std::string CsvField(const std::string& s) {
  if (s.find_first_of(",\"\n") == std::string::npos) return s;
  std::string q = "\"";
  for (const char c : s) {
    if (c == '"') q += "\"\"";
    else q += c;
  }
  q += "\"";
  return q;
}

void WriteCountsCsv(const CountSnapshot& snapshot, std::ostream& out) {
  out << "type,counter_id,counter_name,class_id,class_name,in,out,entries,exits,currently_inside\n";

  for (const auto& l : snapshot.lines) {
    for (const auto& kv : l.per_class) {
      out << "line," << CsvField(l.id) << "," << CsvField(l.name) << ","
          << kv.first << "," << CsvField(GeneralClassName(kv.first)) << ","
          << kv.second.in << "," << kv.second.out << ",,,\n";
    }
  }

  for (const auto& z : snapshot.zones) {
    for (const auto& kv : z.per_class) {
      out << "zone," << CsvField(z.id) << "," << CsvField(z.name) << ","
          << kv.first << "," << CsvField(GeneralClassName(kv.first)) << ",,,"
          << kv.second.entries << "," << kv.second.exits << "," << kv.second.currently_inside << "\n";
    }
  }
}

void WriteCountsCsvFile(const CountSnapshot& snapshot, const std::string& path) {
  std::ofstream f(path);
  if (!f) throw std::runtime_error("Failed to open CSV for writing: " + path);
  WriteCountsCsv(snapshot, f);
  if (!f) throw std::runtime_error("Failed to write CSV: " + path);
}

std::string FormatCountSummary(const CountSnapshot& snapshot) {
  std::ostringstream oss;
  if (snapshot.lines.empty() && snapshot.zones.empty()) return "No counters defined\n";

  for (const auto& l : snapshot.lines) {
    const LineCount t = l.total();
    oss << l.name << " [" << l.id << "]: in=" << t.in << " out=" << t.out << " total=" << (t.in + t.out) << "\n";
    for (const auto& kv : l.per_class) {
      oss << "  - " << GeneralClassName(kv.first) << ": in=" << kv.second.in << " out=" << kv.second.out << "\n";
    }
  }

  for (const auto& z : snapshot.zones) {
    const ZoneCount t = z.total();
    oss << z.name << " [" << z.id << "]: inside=" << t.currently_inside << " entered=" << t.entries
        << " exited=" << t.exits << "\n";
    for (const auto& kv : z.per_class) {
      oss << "  - " << GeneralClassName(kv.first) << ": inside=" << kv.second.currently_inside
          << " entered=" << kv.second.entries << " exited=" << kv.second.exits << "\n";
    }
  }
  return oss.str();
}

} // namespace occ
