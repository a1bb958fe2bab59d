#pragma once

#include <string>

#include "core/counter_definitions.hpp"

namespace occ {

// Loads line/zone definitions from YAML, validates geometry, throws on error.
// Endpoint and vertex order are kept exactly as written.
CounterDefinitions LoadCounterDefinitionsFromYamlFile(const std::string& path);
CounterDefinitions LoadCounterDefinitionsFromYamlString(const std::string& yaml);

std::string CounterDefinitionsToYamlString(const CounterDefinitions& defs);
void SaveCounterDefinitionsToYamlFile(const CounterDefinitions& defs, const std::string& path);

} // namespace occ
