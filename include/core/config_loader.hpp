#pragma once
#include <string>
#include "core/config.hpp"

namespace occ {

// Loads YAML at 'path', applies defaults, validates, throws on error
AppConfig LoadConfigFromYamlFile(const std::string& path);

// Same as above but from an in-memory YAML document
AppConfig LoadConfigFromYamlString(const std::string& yaml);

// Throws error if config is invalid
void ValidateOrThrow(const AppConfig& cfg);

}
