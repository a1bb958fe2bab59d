#pragma once

#include <ostream>
#include <string>

#include "core/count_snapshot.hpp"

namespace occ {

// One row per counter and class:
// type,counter_id,counter_name,class_id,class_name,in,out,entries,exits,currently_inside
void WriteCountsCsv(const CountSnapshot& snapshot, std::ostream& out);

// Same, to a file. Throws std::runtime_error if it cannot be written
void WriteCountsCsvFile(const CountSnapshot& snapshot, const std::string& path);

// Multi-line human readable summary, one block per counter
std::string FormatCountSummary(const CountSnapshot& snapshot);

} // namespace occ
