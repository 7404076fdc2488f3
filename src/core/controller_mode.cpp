#include "core/controller_mode.hpp"

namespace dac {

const char* ToString(ControllerMode m) {
  switch (m) {
    case ControllerMode::Idle: return "idle";
    case ControllerMode::Manual: return "manual";
    case ControllerMode::AutoApproach: return "auto";
  }
  return "unknown";
}

std::optional<ControllerMode> ParseControllerMode(const std::string& s) {
  if (s == "idle") return ControllerMode::Idle;
  if (s == "manual") return ControllerMode::Manual;
  if (s == "auto" || s == "auto_approach" || s == "track") return ControllerMode::AutoApproach;
  return std::nullopt;
}

} // namespace dac
