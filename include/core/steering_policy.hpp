#pragma once

#include <optional>

#include "core/command.hpp"
#include "core/config.hpp"
#include "core/detections.hpp"

/*
    Steering policy: target geometry in, at most one motion command out.

    offset = target_center_x / frame_width - 0.5   (negative: target left of center)
    size   = target_width / frame_width            (monocular stand-in for distance)

    Centering has priority over closing distance. Both comparisons are inclusive at the boundary:
        |offset| <= center_tolerance  -> centered
        size     >= size_threshold    -> close enough

    The decision is a pure function of (target, thresholds); the policy keeps no state between cycles.
*/

namespace dac {

enum class ApproachState {
  Searching,   // no target this cycle
  Centering,   // target off-center, rotate toward it
  Advancing,   // centered but small, move forward
  Arrived      // centered and large, stop
};

const char* ToString(ApproachState s);

struct TargetGeometry {
  float offset{0.f};
  float size{0.f};
};

struct SteeringDecision {
  ApproachState state{ApproachState::Searching};
  std::optional<Command> command;   // empty for Arrived
};

class SteeringPolicy {
public:
  explicit SteeringPolicy(SteeringConfig cfg);

  // std::nullopt for a zero-width frame
  static std::optional<TargetGeometry> Geometry(const BBox& target, int frame_width);

  ApproachState classify(const TargetGeometry& g) const;
  SteeringDecision decide(const std::optional<TargetGeometry>& target) const;

  // Degrees to turn for a given offset, sign follows the offset
  int rotation_for(float offset) const;

  const SteeringConfig& config() const { return cfg_; }

private:
  SteeringConfig cfg_;
};

} // namespace dac
