#include "apps/hud_overlay.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

#include "core/labels/coco_labels.hpp"

namespace dac {

static constexpr auto kHudPeriod = std::chrono::milliseconds(200);

static cv::Scalar ColorForMode(ControllerMode m) {
  switch (m) {
    case ControllerMode::AutoApproach: return cv::Scalar(0, 255, 0);
    case ControllerMode::Manual: return cv::Scalar(0, 255, 255);
    case ControllerMode::Idle: break;
  }
  return cv::Scalar(200, 200, 200);
}

static cv::Scalar ColorForReply(const TransportReply& r) {
  if (r.acknowledged()) return cv::Scalar(0, 255, 0);
  if (r.ok()) return cv::Scalar(0, 255, 255);
  return cv::Scalar(0, 0, 255);
}

HudOverlay::HudOverlay(DisplayConfig cfg) : cfg_(std::move(cfg)) {}

void HudOverlay::draw_candidates(cv::Mat& bgr, const CycleReport& cycle) const {
  const int font = cv::FONT_HERSHEY_SIMPLEX;

  for (const auto& c : cycle.candidates) {
    const cv::Rect r(cv::Point(static_cast<int>(c.bbox.x), static_cast<int>(c.bbox.y)),
                     cv::Point(static_cast<int>(c.bbox.x2()), static_cast<int>(c.bbox.y2())));
    cv::rectangle(bgr, r, cv::Scalar(255, 160, 0), 2);

    std::ostringstream label;
    label << CocoClassName(c.class_id);
    if (cfg_.show_confidence) label << " " << std::fixed << std::setprecision(2) << c.confidence;
    cv::putText(bgr, label.str(), cv::Point(r.x, std::max(12, r.y - 6)), font, 0.5, cv::Scalar(255, 160, 0), 1,
                cv::LINE_AA);
  }

  if (cycle.target) {
    const auto& b = cycle.target->bbox;
    cv::rectangle(bgr,
                  cv::Point(static_cast<int>(b.x), static_cast<int>(b.y)),
                  cv::Point(static_cast<int>(b.x2()), static_cast<int>(b.y2())),
                  cv::Scalar(0, 0, 255), 3);
    cv::drawMarker(bgr, cv::Point(static_cast<int>(b.center_x()), static_cast<int>(b.center_y())),
                   cv::Scalar(0, 0, 255), cv::MARKER_CROSS, 16, 2);
  }

  // Image center line, the reference the steering offset is measured against
  const int cx = bgr.cols / 2;
  cv::line(bgr, cv::Point(cx, 0), cv::Point(cx, bgr.rows), cv::Scalar(180, 180, 180), 1);
}

void HudOverlay::refresh_panel(const cv::Mat& like, const HudStatus& status, const Metrics& metrics,
                               const EventLog* log) {
  const auto now_ns = NowNs();
  double dt = 0.0;
  if (last_tick_ns_ != 0) dt = static_cast<double>(now_ns - last_tick_ns_) / 1e9;
  last_tick_ns_ = now_ns;

  std::vector<LogEvent> events;
  if (log && cfg_.hud_log_lines > 0) events = log->recent(static_cast<std::size_t>(cfg_.hud_log_lines));

  const int line = 16;
  const int panel_w = std::min(420, std::max(1, like.cols - 12));
  const int rows = 6 + static_cast<int>(metrics.stages().size()) + static_cast<int>(events.size());
  const int panel_h = 14 + line * rows;

  panel_.create(panel_h, panel_w, like.type());
  panel_.setTo(cv::Scalar(0, 0, 0));
  cv::rectangle(panel_, cv::Rect(0, 0, panel_w, panel_h), cv::Scalar(80, 80, 80), 1);

  const int font = cv::FONT_HERSHEY_SIMPLEX;
  const double scale = 0.42;

  auto put_at = [&](int x, int y, const std::string& s, const cv::Scalar& color = cv::Scalar(255, 255, 255)) {
    cv::putText(panel_, s, cv::Point(x, y), font, scale, color, 1, cv::LINE_AA);
  };

  int y = 16;

  {
    std::ostringstream oss;
    oss << "MODE " << ToString(status.mode) << "   engagement " << status.engagement;
    put_at(6, y, oss.str(), ColorForMode(status.mode));
    y += line;
  }

  {
    std::ostringstream oss;
    if (status.cycle) {
      oss << "state " << ToString(status.cycle->state) << "   targets " << status.cycle->candidates.size()
          << "   frame " << status.cycle->frame_id;
    } else {
      oss << "state -   targets -   frame " << status.frame_id;
    }
    put_at(6, y, oss.str());
    y += line;
  }

  if (status.last_command) {
    const auto& rec = *status.last_command;
    std::ostringstream oss;
    oss << "last " << ToString(rec.source) << " '" << ToWire(rec.command) << "' -> " << ToString(rec.reply.status);
    if (!rec.reply.text.empty()) oss << " '" << rec.reply.text << "'";
    oss << " " << rec.reply.elapsed.count() << "ms";
    put_at(6, y, oss.str(), ColorForReply(rec.reply));
  } else {
    put_at(6, y, "last -");
  }
  y += line;

  {
    std::ostringstream oss;
    oss << "sent " << status.counters.sent << "  ok " << status.counters.acknowledged << "  timeout "
        << status.counters.timeouts << "  err " << status.counters.errors
        << (status.settling ? "   settling" : "");
    put_at(6, y, oss.str());
    y += line;
  }

  y += 4;
  put_at(6, y, "STAGE");
  put_at(140, y, "FPS");
  put_at(200, y, "LAT(ms)");
  put_at(280, y, "FAIL");
  y += line;

  for (const auto& up : metrics.stages()) {
    const StageMetrics& m = *up;
    auto& p = prev_stage_[up.get()];

    const auto c = m.count.load(std::memory_order_relaxed);
    const double fps = (dt > 0.0) ? (static_cast<double>(c - p.count) / dt) : 0.0;
    p.count = c;

    const double lat_ms = static_cast<double>(m.avg_latency_ns.load(std::memory_order_relaxed)) / 1e6;

    std::ostringstream s_fps, s_lat;
    s_fps << std::fixed << std::setprecision(1) << fps;
    s_lat << std::fixed << std::setprecision(1) << lat_ms;

    put_at(6, y, m.name);
    put_at(140, y, s_fps.str());
    put_at(200, y, s_lat.str());
    put_at(280, y, std::to_string(m.failures.load(std::memory_order_relaxed)));
    y += line;
  }

  for (const auto& ev : events) {
    const cv::Scalar color = (ev.level == LogLevel::Info) ? cv::Scalar(200, 200, 200) : cv::Scalar(0, 165, 255);
    put_at(6, y, "[" + ev.category + "] " + ev.message, color);
    y += line;
  }
}

void HudOverlay::draw(cv::Mat& bgr, const HudStatus& status, const Metrics& metrics, const EventLog* log) {
  if (bgr.empty()) return;

  if (cfg_.show_boxes && status.cycle) draw_candidates(bgr, *status.cycle);
  if (!cfg_.show_hud) return;

  const auto now = std::chrono::steady_clock::now();
  const bool needs_refresh =
      panel_.empty() || panel_.type() != bgr.type() || (now - last_refresh_ >= kHudPeriod);
  if (needs_refresh) {
    last_refresh_ = now;
    refresh_panel(bgr, status, metrics, log);
  }

  // Bottom left corner
  const int margin = 6;
  const int w = std::min(panel_.cols, bgr.cols - 2 * margin);
  const int h = std::min(panel_.rows, bgr.rows - 2 * margin);
  if (w > 0 && h > 0) {
    panel_(cv::Rect(0, 0, w, h)).copyTo(bgr(cv::Rect(margin, bgr.rows - h - margin, w, h)));
  }
}

} // namespace dac
