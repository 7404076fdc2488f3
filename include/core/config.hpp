#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace dac {

enum class TargetSelectionPolicy {
  MaxConfidence,
  MaxArea
};

enum class RotateMode {
  Fixed,         // every correction turns rotate_step_deg
  Proportional   // turn |offset| * rotate_gain_deg
};

enum class ModelLayout {
  YoloV5,   // [1, N, 5 + classes], objectness at index 4
  YoloV8    // [1, 4 + classes, N], no objectness
};

struct VehicleConfig {
  std::string ip = "192.168.10.1";
  int command_port = 8889;
  int local_port = 9000;          // distinct from command_port and the video port
  int reply_timeout_ms = 1000;

  std::vector<std::string> init_commands = {"command", "streamon"};
  bool auto_takeoff = false;
  std::vector<std::string> shutdown_commands = {"land", "streamoff"};
};

struct VideoConfig {
  std::string url = "udp://@0.0.0.0:11111?overrun_nonfatal=1&fifo_size=500000";
  std::string backend = "ffmpeg"; // ffmpeg | any
  int reopen_delay_ms = 500;
  int reopen_after_failures = 50;

  bool flip_vertical = false;
  bool flip_horizontal = false;
};

struct ModelConfig {
  std::string path = "models/yolov5s.onnx";
  int input_width = 640;
  int input_height = 640;
  ModelLayout layout = ModelLayout::YoloV5;
  float nms_threshold = 0.45f;
};

struct DetectionConfig {
  double detect_rate = 5.0;         // detector invocations per second
  int detect_width = 640;           // frames are downscaled to this width before detection
  float confidence_threshold = 0.5f;  // strictly greater than
  std::vector<int> class_ids = {0}; // COCO person
  ModelConfig model{};
};

struct SteeringConfig {
  float center_tolerance = 0.10f;   // |offset| <= tolerance counts as centered
  float size_threshold = 0.20f;     // box width / frame width >= threshold counts as arrived
  TargetSelectionPolicy target_selection = TargetSelectionPolicy::MaxConfidence;

  RotateMode rotate_mode = RotateMode::Fixed;
  int rotate_step_deg = 15;
  float rotate_gain_deg = 60.f;
  int search_rotate_deg = 30;
  int forward_step_cm = 30;

  bool land_on_arrival = false;

  // Settle delays in milliseconds per opcode, default_settle_ms for anything else
  std::map<std::string, int> settle_ms = {{"cw", 1000}, {"ccw", 1000}, {"forward", 2000}, {"takeoff", 5000}};
  int default_settle_ms = 1000;
};

struct DisplayConfig {
  bool enabled = true;
  std::string window_name = "Drone Approach";
  int fps = 30;

  bool show_boxes = true;
  bool show_confidence = true;
  bool show_hud = true;
  int hud_log_lines = 4;
};

struct IntakeConfig {
  bool stdin_enabled = true;
  bool keyboard_enabled = true;
};

struct AppConfig {
  VehicleConfig vehicle{};
  VideoConfig video{};
  DetectionConfig detection{};
  SteeringConfig steering{};
  DisplayConfig display{};
  IntakeConfig intake{};
};

const char* ToString(TargetSelectionPolicy p);
const char* ToString(RotateMode m);
const char* ToString(ModelLayout l);

} // namespace dac
