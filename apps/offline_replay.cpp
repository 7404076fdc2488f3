#include <iostream>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "apps/app_support.hpp"
#include "apps/hud_overlay.hpp"

#include "core/approach_controller.hpp"
#include "core/command_dispatcher.hpp"
#include "core/config_loader.hpp"
#include "core/shared_state.hpp"
#include "core/yolo_dnn.hpp"

#include "infra/dry_run_channel.hpp"
#include "infra/event_log.hpp"
#include "infra/metrics.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/videoio.hpp>

// offline_replay.cpp is a debugging tool
// Plays a recorded video through the controller in auto mode. Commands go to a dry-run channel instead of a vehicle,
// so the decisions can be checked frame by frame without flying

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: offline_replay <video> [config.yaml]\n";
    return 2;
  }
  const std::string video_path = argv[1];
  const std::string cfg_path = (argc > 2) ? argv[2] : "configs/dev.yaml";

  try {
    dac::AppConfig cfg = dac::LoadConfigFromYamlFile(cfg_path);

    dac::EventLog log;
    log.info("main", "loaded config " + cfg_path);

    dac::YoloDnn detector(dac::MakeDetectorParams(cfg.detection));

    cv::VideoCapture cap(video_path);
    if (!cap.isOpened()) throw std::runtime_error("offline_replay: could not open video '" + video_path + "'");

    const double src_fps = cap.get(cv::CAP_PROP_FPS);
    const auto frame_period = std::chrono::microseconds(
        static_cast<long long>(1e6 / ((src_fps > 1.0) ? src_fps : 30.0)));

    dac::DryRunChannel channel(&log);
    dac::CommandDispatcher dispatcher(channel, dac::MakeSettleTable(cfg.steering), &log);

    dac::SharedState shared;
    dac::Metrics metrics;
    dac::StageMetrics* control_metrics = metrics.make_stage("control");
    dac::StageMetrics* detect_metrics = metrics.make_stage("detect");

    dac::ApproachController controller(cfg.detection, cfg.steering, detector, dispatcher, shared, &log, detect_metrics);
    shared.set_mode(dac::ControllerMode::AutoApproach);

    dac::HudOverlay hud(cfg.display);
    if (cfg.display.enabled) cv::namedWindow(cfg.display.window_name, cv::WINDOW_AUTOSIZE);

    std::uint64_t frame_id = 0;
    bool quit = false;

    while (!quit) {
      const auto t0 = std::chrono::steady_clock::now();

      dac::Frame f;
      if (!cap.read(f.image) || f.image.empty()) break;
      f.capture_time = t0;
      f.sequence_id = frame_id++;

      {
        dac::StageTimer timer(control_metrics);
        controller.step(f, t0);
      }

      if (cfg.display.enabled) {
        cv::Mat canvas = f.image.clone();

        dac::HudStatus status;
        status.mode = shared.mode();
        status.engagement = shared.engagement();
        status.frame_id = f.sequence_id;
        status.cycle = controller.last_detection() ? &*controller.last_detection() : nullptr;
        status.last_command = dispatcher.last();
        status.counters = dispatcher.counters();
        status.settling = !dispatcher.autonomous_ready(t0);

        hud.draw(canvas, status, metrics, &log);
        cv::imshow(cfg.display.window_name, canvas);

        const int key = cv::waitKey(1) & 0xFF;
        if (key == 27 || key == 'q') quit = true;
        // Re-engage after an arrival to keep exercising the policy on the rest of the clip
        if (key == 'a') shared.set_mode(dac::ControllerMode::AutoApproach);
      }

      std::this_thread::sleep_until(t0 + frame_period);
    }

    if (cfg.display.enabled) cv::destroyWindow(cfg.display.window_name);

    log.info("main", "replayed " + std::to_string(frame_id) + " frame(s), " + std::to_string(channel.sent_count()) +
                         " command(s) would have been sent");

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
