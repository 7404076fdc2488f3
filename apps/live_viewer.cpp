#include <iostream>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include "apps/app_support.hpp"
#include "apps/hud_overlay.hpp"

#include "core/command_dispatcher.hpp"
#include "core/config_loader.hpp"
#include "core/operator_console.hpp"
#include "core/session.hpp"
#include "core/shared_state.hpp"

#include "infra/event_log.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "infra/udp_command_channel.hpp"

#include "stages/frame_source_stage.hpp"
#include "stages/manual_intake_stage.hpp"

#include <opencv2/highgui.hpp>

static std::atomic_bool g_sigint{false};

static void HandleSigint(int) {
  g_sigint.store(true, std::memory_order_relaxed);
}

// live_viewer.cpp is a bring-up tool
// Video and manual control only, no detector. Good for checking the link, the stream and the key bindings

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    dac::AppConfig cfg = dac::LoadConfigFromYamlFile(cfg_path);

    dac::EventLog log;
    log.info("main", "loaded config " + cfg_path);

    std::signal(SIGINT, HandleSigint);

    dac::StopSource global_stop;

    dac::UdpCommandChannel channel(dac::MakeChannelParams(cfg.vehicle), &log);
    dac::CommandDispatcher dispatcher(channel, dac::MakeSettleTable(cfg.steering), &log);

    dac::SharedState shared;
    shared.set_mode(dac::ControllerMode::Manual);

    dac::Metrics metrics;
    dac::StageMetrics* frame_metrics = metrics.make_stage("frame_source");

    dac::StartSession(dispatcher, cfg.vehicle, &log);

    dac::OperatorConsole console(dispatcher, shared, &log);
    dac::FrameSourceStage frame_source(frame_metrics, cfg.video, shared.frames(), &log);
    std::unique_ptr<dac::ManualIntakeStage> intake;
    if (cfg.intake.stdin_enabled) intake = std::make_unique<dac::ManualIntakeStage>(console, &log);

    frame_source.start(global_stop.token());
    if (intake) intake->start(global_stop.token());

    dac::HudOverlay hud(cfg.display);
    cv::namedWindow(cfg.display.window_name, cv::WINDOW_AUTOSIZE);

    const auto period = std::chrono::microseconds(1000000 / std::max(1, cfg.display.fps));

    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        global_stop.request_stop();
        break;
      }

      const auto t0 = std::chrono::steady_clock::now();

      if (auto snap = shared.frames().read_snapshot()) {
        if (!snap->value.empty()) {
          cv::Mat canvas = snap->value.image.clone();

          dac::HudStatus status;
          status.mode = shared.mode();
          status.frame_id = snap->value.sequence_id;
          status.last_command = dispatcher.last();
          status.counters = dispatcher.counters();

          hud.draw(canvas, status, metrics, &log);
          cv::imshow(cfg.display.window_name, canvas);
        }
      }

      const int key = cv::waitKey(1);
      if (key == 27) {
        global_stop.request_stop();
        break;
      }

      // No autonomy here, only the command keys are bound
      const int k = key & 0xFF;
      if (key >= 0 && (k == 't' || k == 'l' || k == 'e' || k == 'b')) console.key(k);

      std::this_thread::sleep_until(t0 + period);
    }

    cv::destroyWindow(cfg.display.window_name);

    if (intake) intake->stop();
    frame_source.stop();

    dac::EndSession(dispatcher, cfg.vehicle, &log);

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
