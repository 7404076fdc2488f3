#include "core/approach_controller.hpp"

#include <exception>
#include <iomanip>
#include <sstream>

#include <opencv2/imgproc.hpp>

#include "core/coordinate_mapper.hpp"
#include "core/target_selector.hpp"

namespace dac {

ApproachController::ApproachController(const DetectionConfig& detection,
                                       const SteeringConfig& steering,
                                       Detector& detector,
                                       CommandDispatcher& dispatcher,
                                       SharedState& shared,
                                       EventLog* log,
                                       StageMetrics* detect_metrics)
    : detection_(detection),
      policy_(steering),
      detector_(detector),
      dispatcher_(dispatcher),
      shared_(shared),
      log_(log),
      detect_metrics_(detect_metrics),
      limiter_(detection.detect_rate),
      seen_engagement_(shared.engagement()) {}

CycleReport ApproachController::step(const Frame& frame, Clock::time_point now) {
  CycleReport report;
  if (frame.empty()) return report;

  report.frame_id = frame.sequence_id;
  report.frame_size = frame.image.size();

  // A fresh engagement looks at the scene right away instead of waiting out the previous period
  const auto engagement = shared_.engagement();
  if (engagement != seen_engagement_) {
    seen_engagement_ = engagement;
    limiter_.reset();
  }

  if (!limiter_.try_acquire(now)) return report;

  const cv::Size src = frame.image.size();
  const cv::Size det = DetectionSizeFor(src, detection_.detect_width);
  if (det.width <= 0 || det.height <= 0) return report;

  std::vector<Detection> raw;
  {
    StageTimer timer(detect_metrics_);
    try {
      cv::Mat small;
      if (det == src) {
        small = frame.image;
      } else {
        cv::resize(frame.image, small, det, 0, 0, cv::INTER_AREA);
      }
      raw = detector_.detect(small);
    } catch (const std::exception& e) {
      if (detect_metrics_) detect_metrics_->on_failure();
      if (log_) log_->error("detect", std::string("frame ") + std::to_string(frame.sequence_id) + " skipped: " + e.what());
      return report;
    }
  }

  report.detection_ran = true;

  const auto kept = FilterDetections(raw, detection_.class_ids, detection_.confidence_threshold);
  const ScaleFactors scale = ComputeScale(src, det);
  report.candidates = MapToSource(kept, scale, src);
  report.target = SelectTarget(report.candidates, policy_.config().target_selection);

  std::optional<TargetGeometry> geometry;
  if (report.target) geometry = SteeringPolicy::Geometry(report.target->bbox, src.width);
  report.state = geometry ? policy_.classify(*geometry) : ApproachState::Searching;

  const bool driving = shared_.mode() == ControllerMode::AutoApproach && dispatcher_.autonomous_ready(now);
  if (driving) {
    SteeringDecision decision = policy_.decide(geometry);
    report.state = decision.state;
    report.decision = decision;
  }

  if (log_) {
    std::ostringstream oss;
    oss << "frame " << frame.sequence_id << ": " << raw.size() << " raw, " << report.candidates.size()
        << " candidate(s)";
    if (geometry) {
      oss << std::fixed << std::setprecision(2) << ", target conf " << report.target->confidence << " offset "
          << geometry->offset << " size " << geometry->size;
    }
    oss << " -> " << ToString(report.state);
    if (report.decision && report.decision->command) {
      oss << " '" << ToWire(*report.decision->command) << "'";
    } else if (!driving) {
      oss << " (" << ToString(shared_.mode()) << ", no command)";
    }
    log_->info("cycle", oss.str());
  }

  if (report.decision) {
    if (report.decision->command) {
      report.reply = dispatcher_.dispatch(*report.decision->command, CommandSource::Autonomous);
      report.command_sent = true;
    } else if (report.decision->state == ApproachState::Arrived) {
      on_arrival(report);
    }
  }

  last_detection_ = report;
  return report;
}

void ApproachController::on_arrival(CycleReport& report) {
  shared_.set_mode(ControllerMode::Idle);
  if (log_) log_->info("approach", "target reached, engagement " + std::to_string(shared_.engagement()) + " ended");

  if (policy_.config().land_on_arrival) {
    report.reply = dispatcher_.dispatch(Simple("land"), CommandSource::System);
    report.command_sent = true;
  }
}

} // namespace dac
