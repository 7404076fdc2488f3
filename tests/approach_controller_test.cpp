#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/approach_controller.hpp"
#include "infra/dry_run_channel.hpp"

namespace {

// Returns whatever the test put in `next`, in detection-resolution pixels
class FakeDetector final : public dac::Detector {
public:
  std::vector<dac::Detection> detect(const cv::Mat& bgr) override {
    ++calls;
    last_size = bgr.size();
    if (fail) throw std::runtime_error("inference failed");
    return next;
  }

  std::vector<dac::Detection> next;
  bool fail{false};
  int calls{0};
  cv::Size last_size{};
};

dac::Detection Person(float x, float w, float conf = 0.9f) {
  dac::Detection d;
  d.bbox = dac::BBox{x, 100.f, w, 120.f};
  d.class_id = 0;
  d.confidence = conf;
  return d;
}

dac::Frame MakeFrame(std::uint64_t id) {
  dac::Frame f;
  f.sequence_id = id;
  f.image = cv::Mat(720, 1280, CV_8UC3, cv::Scalar(30, 30, 30));
  return f;
}

}  // namespace

int main() {
  using namespace std::chrono_literals;
  using Clock = std::chrono::steady_clock;

  dac::EventLog log(64, false);
  dac::DryRunChannel channel(&log);
  dac::CommandDispatcher dispatcher(channel, dac::SettleTable(0ms), &log);
  dac::SharedState shared;
  dac::StageMetrics detect_metrics("detect");
  FakeDetector detector;

  dac::DetectionConfig dcfg;      // 5 Hz, 640 wide, > 0.5, person only
  dac::SteeringConfig scfg;
  dac::ApproachController controller(dcfg, scfg, detector, dispatcher, shared, &log, &detect_metrics);

  auto t = Clock::now();
  std::uint64_t id = 0;

  // No frame yet: nothing happens
  {
    const auto r = controller.step(dac::Frame{}, t);
    if (r.detection_ran || detector.calls != 0) {
      std::cerr << "empty frame must skip the cycle\n";
      return 1;
    }
  }

  // Idle: detection runs and is reported, but nothing is sent
  detector.next = {Person(300.f, 40.f)};
  {
    const auto r = controller.step(MakeFrame(id++), t);
    if (!r.detection_ran || r.candidates.size() != 1 || !r.target || r.decision || r.command_sent) {
      std::cerr << "idle cycle should detect without deciding\n";
      return 1;
    }
    if (detector.last_size != cv::Size(640, 360)) {
      std::cerr << "detector should see the 640x360 downscale, got " << detector.last_size << "\n";
      return 1;
    }
    // Box came back in source coordinates (factor 2)
    if (r.target->bbox.x != 600.f || r.target->bbox.w != 80.f || r.state != dac::ApproachState::Advancing) {
      std::cerr << "target not mapped to source frame\n";
      return 1;
    }
    if (!channel.sent().empty()) {
      std::cerr << "idle mode sent a command\n";
      return 1;
    }
  }

  // Not due again within the period
  if (controller.step(MakeFrame(id++), t + 50ms).detection_ran) {
    std::cerr << "detection ran before its period\n";
    return 1;
  }

  // Engaging starts a new cycle immediately; no detections -> search rotation every due cycle
  shared.set_mode(dac::ControllerMode::AutoApproach);
  detector.next.clear();
  for (int i = 0; i < 3; ++i) {
    t += (i == 0) ? 60ms : 200ms;
    const auto r = controller.step(MakeFrame(id++), t);
    if (!r.detection_ran || !r.command_sent || r.state != dac::ApproachState::Searching) {
      std::cerr << "search cycle " << i << " did not rotate\n";
      return 1;
    }
  }
  {
    const auto sent = channel.sent();
    if (sent.size() != 3 || sent[0] != "cw 30" || sent[2] != "cw 30") {
      std::cerr << "expected three 'cw 30' search commands\n";
      return 1;
    }
  }

  // Low-confidence and wrong-class detections are not targets
  t += 200ms;
  {
    dac::Detection car = Person(300.f, 40.f, 0.95f);
    car.class_id = 2;
    detector.next = {car, Person(300.f, 40.f, 0.4f)};
    const auto r = controller.step(MakeFrame(id++), t);
    if (!r.candidates.empty() || r.state != dac::ApproachState::Searching || channel.sent().back() != "cw 30") {
      std::cerr << "filtered detections must leave the controller searching\n";
      return 1;
    }
  }

  // Target right of center -> clockwise correction
  t += 200ms;
  detector.next = {Person(480.f, 40.f)};
  {
    const auto r = controller.step(MakeFrame(id++), t);
    if (r.state != dac::ApproachState::Centering || channel.sent().back() != "cw 15") {
      std::cerr << "off-center target must produce cw 15\n";
      return 1;
    }
  }

  // Centered and small -> forward
  t += 200ms;
  detector.next = {Person(300.f, 40.f)};
  controller.step(MakeFrame(id++), t);
  if (channel.sent().back() != "forward 30") {
    std::cerr << "centered small target must produce forward 30\n";
    return 1;
  }

  // Centered and large -> arrival, engagement ends, no more motion
  t += 200ms;
  detector.next = {Person(224.f, 192.f)};
  {
    const std::size_t before = channel.sent().size();
    const auto r = controller.step(MakeFrame(id++), t);
    if (r.state != dac::ApproachState::Arrived || r.command_sent || channel.sent().size() != before) {
      std::cerr << "arrival must not send motion\n";
      return 1;
    }
    if (shared.mode() != dac::ControllerMode::Idle) {
      std::cerr << "arrival must end the engagement\n";
      return 1;
    }

    t += 200ms;
    detector.next.clear();
    const auto idle = controller.step(MakeFrame(id++), t);
    if (!idle.detection_ran || idle.command_sent || channel.sent().size() != before) {
      std::cerr << "controller kept steering after arrival\n";
      return 1;
    }
  }

  // Detector failure is logged and the cycle skipped
  t += 200ms;
  detector.fail = true;
  {
    const auto r = controller.step(MakeFrame(id++), t);
    if (r.detection_ran || detect_metrics.failures.load() != 1) {
      std::cerr << "detector exception must skip the cycle and count a failure\n";
      return 1;
    }
  }
  detector.fail = false;

  // Settle delay gates autonomous commands but not detection
  {
    dac::DryRunChannel slow_channel(nullptr);
    dac::CommandDispatcher slow(slow_channel, dac::SettleTable(), nullptr);   // cw settles 1 s
    dac::SharedState s2;
    dac::ApproachController c2(dcfg, scfg, detector, slow, s2, nullptr, nullptr);
    s2.set_mode(dac::ControllerMode::AutoApproach);

    detector.next.clear();
    const auto base = Clock::now();
    c2.step(MakeFrame(1), base);
    const auto during = c2.step(MakeFrame(2), base + 400ms);
    if (!during.detection_ran || during.decision || slow_channel.sent().size() != 1) {
      std::cerr << "command issued during settle\n";
      return 1;
    }
    c2.step(MakeFrame(3), base + 1400ms);
    if (slow_channel.sent().size() != 2) {
      std::cerr << "command not issued after settle\n";
      return 1;
    }
  }

  // land_on_arrival sends land once the target is reached
  {
    dac::DryRunChannel ch3(nullptr);
    dac::CommandDispatcher d3(ch3, dac::SettleTable(0ms), nullptr);
    dac::SharedState s3;
    dac::SteeringConfig landing = scfg;
    landing.land_on_arrival = true;
    dac::ApproachController c3(dcfg, landing, detector, d3, s3, nullptr, nullptr);
    s3.set_mode(dac::ControllerMode::AutoApproach);

    detector.next = {Person(224.f, 192.f)};
    const auto r = c3.step(MakeFrame(1), Clock::now());
    const auto sent = ch3.sent();
    if (r.state != dac::ApproachState::Arrived || sent.size() != 1 || sent[0] != "land") {
      std::cerr << "arrival with land_on_arrival must send land\n";
      return 1;
    }
  }

  if (!controller.last_detection() || log.total() == 0) {
    std::cerr << "cycles were not recorded\n";
    return 1;
  }

  return 0;
}
