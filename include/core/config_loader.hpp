#pragma once
#include <string>
#include "core/command.hpp"
#include "core/config.hpp"

namespace dac {

// Loads YAML at 'path', applies defaults, validates, throws on error
AppConfig LoadConfigFromYamlFile(const std::string& path);

// Same as above for an in-memory document
AppConfig LoadConfigFromYamlString(const std::string& yaml);

// Throws error if config is invalid
void ValidateOrThrow(const AppConfig& cfg);

SettleTable MakeSettleTable(const SteeringConfig& cfg);

} // namespace dac
