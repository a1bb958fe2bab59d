#pragma once

#include <optional>
#include <string>

#include "core/counter_definitions.hpp"

namespace occ {

// Case-insensitive COCO name lookup
std::optional<int> ClassIdByName(const std::string& name);

// "ALL" -> every class of the label table, "NONE" -> no class, "COMMON" -> road and pedestrian classes.
// Case-insensitive, throws std::invalid_argument on anything else
ClassFilter ResolveClassPreset(const std::string& preset);

} // namespace occ
