#include "apps/app_support.hpp"

#include <algorithm>

namespace dac {

UdpCommandChannel::Params MakeChannelParams(const VehicleConfig& cfg) {
  UdpCommandChannel::Params p;
  p.remote_ip = cfg.ip;
  p.remote_port = static_cast<std::uint16_t>(cfg.command_port);
  p.local_port = static_cast<std::uint16_t>(cfg.local_port);
  p.reply_timeout = std::chrono::milliseconds(cfg.reply_timeout_ms);
  return p;
}

YoloDnn::Params MakeDetectorParams(const DetectionConfig& cfg) {
  YoloDnn::Params p;
  p.onnx_path = cfg.model.path;
  p.input_w = cfg.model.input_width;
  p.input_h = cfg.model.input_height;
  p.layout = cfg.model.layout;
  p.nms_thresh = cfg.model.nms_threshold;
  // Loose pre-NMS floor; the configured threshold is applied afterwards by FilterDetections
  p.conf_thresh = std::min(0.25f, cfg.confidence_threshold);
  return p;
}

} // namespace dac
