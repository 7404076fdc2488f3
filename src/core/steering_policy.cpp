#include "core/steering_policy.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace dac {

namespace {
// Pixel geometry divided by frame width is not exact in binary; a box sitting exactly on a threshold must still count
// as on it, from either side of center.
constexpr float kBoundaryEps = 1e-5f;
}

const char* ToString(ApproachState s) {
  switch (s) {
    case ApproachState::Searching: return "searching";
    case ApproachState::Centering: return "centering";
    case ApproachState::Advancing: return "advancing";
    case ApproachState::Arrived: return "arrived";
  }
  return "unknown";
}

SteeringPolicy::SteeringPolicy(SteeringConfig cfg) : cfg_(std::move(cfg)) {}

std::optional<TargetGeometry> SteeringPolicy::Geometry(const BBox& target, int frame_width) {
  if (frame_width <= 0) return std::nullopt;

  const double W = static_cast<double>(frame_width);
  const double cx = static_cast<double>(target.x) + static_cast<double>(target.w) / 2.0;
  TargetGeometry g;
  g.offset = static_cast<float>(cx / W - 0.5);
  g.size = static_cast<float>(static_cast<double>(target.w) / W);
  return g;
}

ApproachState SteeringPolicy::classify(const TargetGeometry& g) const {
  if (std::fabs(g.offset) > cfg_.center_tolerance + kBoundaryEps) return ApproachState::Centering;
  if (g.size < cfg_.size_threshold - kBoundaryEps) return ApproachState::Advancing;
  return ApproachState::Arrived;
}

int SteeringPolicy::rotation_for(float offset) const {
  int deg = cfg_.rotate_step_deg;
  if (cfg_.rotate_mode == RotateMode::Proportional) {
    deg = static_cast<int>(std::lround(std::fabs(offset) * cfg_.rotate_gain_deg));
    deg = std::clamp(deg, 1, 360);
  }
  return (offset >= 0.f) ? deg : -deg;
}

SteeringDecision SteeringPolicy::decide(const std::optional<TargetGeometry>& target) const {
  SteeringDecision d;

  if (!target) {
    // Sweep clockwise until something shows up
    d.state = ApproachState::Searching;
    d.command = Rotate(cfg_.search_rotate_deg);
    return d;
  }

  d.state = classify(*target);
  switch (d.state) {
    case ApproachState::Centering:
      d.command = Rotate(rotation_for(target->offset));
      break;
    case ApproachState::Advancing:
      d.command = Forward(cfg_.forward_step_cm);
      break;
    case ApproachState::Arrived:
    case ApproachState::Searching:
      break;
  }
  return d;
}

} // namespace dac
