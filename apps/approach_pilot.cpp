#include <iostream>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include "apps/app_support.hpp"
#include "apps/hud_overlay.hpp"

#include "core/approach_controller.hpp"
#include "core/command_dispatcher.hpp"
#include "core/config_loader.hpp"
#include "core/operator_console.hpp"
#include "core/session.hpp"
#include "core/shared_state.hpp"
#include "core/yolo_dnn.hpp"

#include "infra/event_log.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/udp_command_channel.hpp"

#include "stages/frame_source_stage.hpp"
#include "stages/manual_intake_stage.hpp"

#include <opencv2/highgui.hpp>  // cv::namedWindow, cv::imshow, cv::waitKey

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// approach_pilot.cpp is the full system
// Video in, detection, steering, commands out, with the operator able to take over at any time

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    dac::AppConfig cfg = dac::LoadConfigFromYamlFile(cfg_path);

    dac::EventLog log;
    log.info("main", "loaded config " + cfg_path);

    std::signal(SIGINT, HandleSigint);

    dac::StopSource global_stop;

    // Startup failures (model, socket) throw and end the program before anything is sent to the vehicle
    dac::YoloDnn detector(dac::MakeDetectorParams(cfg.detection));
    log.info("main", "model loaded: " + cfg.detection.model.path + " (" + dac::ToString(cfg.detection.model.layout) + ")");

    dac::UdpCommandChannel channel(dac::MakeChannelParams(cfg.vehicle), &log);
    dac::CommandDispatcher dispatcher(channel, dac::MakeSettleTable(cfg.steering), &log);

    dac::SharedState shared;
    dac::Metrics metrics;
    dac::StageMetrics* frame_metrics = metrics.make_stage("frame_source");
    dac::StageMetrics* control_metrics = metrics.make_stage("control");
    dac::StageMetrics* detect_metrics = metrics.make_stage("detect");

    dac::StartSession(dispatcher, cfg.vehicle, &log);

    dac::OperatorConsole console(dispatcher, shared, &log);
    dac::ApproachController controller(cfg.detection, cfg.steering, detector, dispatcher, shared, &log, detect_metrics);

    dac::FrameSourceStage frame_source(frame_metrics, cfg.video, shared.frames(), &log);
    std::unique_ptr<dac::ManualIntakeStage> intake;
    if (cfg.intake.stdin_enabled) intake = std::make_unique<dac::ManualIntakeStage>(console, &log);

    frame_source.start(global_stop.token());
    if (intake) intake->start(global_stop.token());

    log.info("main", "ready: type commands, or 'auto' / 'manual' / 'idle'");

    dac::HudOverlay hud(cfg.display);
    if (cfg.display.enabled) cv::namedWindow(cfg.display.window_name, cv::WINDOW_AUTOSIZE);

    const auto period = std::chrono::microseconds(1000000 / std::max(1, cfg.display.fps));
    auto next_tick = std::chrono::steady_clock::now();
    std::uint64_t last_version = 0;

    // Control and render loop, on the main thread (HighGUI needs it)
    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        log.info("main", "interrupted, shutting down");
        global_stop.request_stop();
        break;
      }

      const auto now = std::chrono::steady_clock::now();
      auto snap = shared.frames().read_snapshot();

      // Only steer on frames we have not seen yet; a stalled stream must not keep producing commands
      if (snap && snap->version != last_version) {
        last_version = snap->version;
        dac::StageTimer timer(control_metrics);
        controller.step(snap->value, now);
      }

      if (cfg.display.enabled) {
        if (snap && !snap->value.empty()) {
          cv::Mat canvas = snap->value.image.clone();

          dac::HudStatus status;
          status.mode = shared.mode();
          status.engagement = shared.engagement();
          status.frame_id = snap->value.sequence_id;
          status.cycle = controller.last_detection() ? &*controller.last_detection() : nullptr;
          status.last_command = dispatcher.last();
          status.counters = dispatcher.counters();
          status.settling = !dispatcher.autonomous_ready(now);

          hud.draw(canvas, status, metrics, &log);
          cv::imshow(cfg.display.window_name, canvas);
        }

        const int key = cv::waitKey(1);
        if (key == 27) {
          log.info("main", "operator exited");
          global_stop.request_stop();
          break;
        }
        if (key >= 0 && cfg.intake.keyboard_enabled) console.key(key & 0xFF);
      }

      next_tick += period;
      const auto after = std::chrono::steady_clock::now();
      if (next_tick > after) {
        std::this_thread::sleep_until(next_tick);
      } else {
        next_tick = after;
      }
    }

    if (cfg.display.enabled) cv::destroyWindow(cfg.display.window_name);

    if (intake) intake->stop();
    frame_source.stop();

    shared.set_mode(dac::ControllerMode::Idle);
    dac::EndSession(dispatcher, cfg.vehicle, &log);

    const auto c = dispatcher.counters();
    log.info("main", "commands sent " + std::to_string(c.sent) + ", ok " + std::to_string(c.acknowledged) +
                         ", timeouts " + std::to_string(c.timeouts) + ", errors " + std::to_string(c.errors));

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
