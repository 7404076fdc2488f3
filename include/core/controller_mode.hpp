#pragma once

#include <optional>
#include <string>

namespace dac {

enum class ControllerMode {
  Idle,          // nothing autonomous, operator commands still go out
  Manual,        // operator is flying; detections are shown but not acted on
  AutoApproach   // steering policy drives the vehicle until arrival
};

const char* ToString(ControllerMode m);

// "idle" | "manual" | "auto" (also "auto_approach", "track")
std::optional<ControllerMode> ParseControllerMode(const std::string& s);

} // namespace dac
