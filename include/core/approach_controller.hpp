#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/command_dispatcher.hpp"
#include "core/config.hpp"
#include "core/detections.hpp"
#include "core/detector.hpp"
#include "core/frame.hpp"
#include "core/shared_state.hpp"
#include "core/steering_policy.hpp"
#include "infra/event_log.hpp"
#include "infra/metrics.hpp"
#include "infra/rate_limiter.hpp"

/*
    ApproachController runs one control cycle per call to step(), from the render loop:

        frame -> [rate limit] -> downscale -> detect -> filter -> map to source -> select -> decide -> dispatch

    Detection runs whenever the limiter grants it, whatever the mode, so the operator always sees what the detector
    sees. Commands only go out in AutoApproach, and only once the dispatcher reports the previous command settled.
    A cycle that has no frame, or whose detection is not due, returns a report with detection_ran == false.
*/

namespace dac {

struct CycleReport {
  bool detection_ran{false};
  std::uint64_t frame_id{0};
  cv::Size frame_size{};

  std::vector<Candidate> candidates;   // source-frame coordinates
  std::optional<Candidate> target;
  ApproachState state{ApproachState::Searching};

  // Set only when the steering policy was consulted (AutoApproach and settled)
  std::optional<SteeringDecision> decision;
  bool command_sent{false};
  TransportReply reply{};
};

class ApproachController {
public:
  using Clock = std::chrono::steady_clock;

  ApproachController(const DetectionConfig& detection,
                     const SteeringConfig& steering,
                     Detector& detector,
                     CommandDispatcher& dispatcher,
                     SharedState& shared,
                     EventLog* log,
                     StageMetrics* detect_metrics);

  ApproachController(const ApproachController&) = delete;
  ApproachController& operator=(const ApproachController&) = delete;

  CycleReport step(const Frame& frame, Clock::time_point now);

  // Report of the most recent cycle in which detection ran
  const std::optional<CycleReport>& last_detection() const { return last_detection_; }

  const SteeringPolicy& policy() const { return policy_; }

private:
  void on_arrival(CycleReport& report);

  DetectionConfig detection_;
  SteeringPolicy policy_;
  Detector& detector_;
  CommandDispatcher& dispatcher_;
  SharedState& shared_;
  EventLog* log_;
  StageMetrics* detect_metrics_;

  RateLimiter limiter_;
  std::uint64_t seen_engagement_{0};
  std::optional<CycleReport> last_detection_;
};

} // namespace dac
