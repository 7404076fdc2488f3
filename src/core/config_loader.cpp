#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <sstream>
#include <stdexcept>

#include "core/labels/coco_labels.hpp"

namespace dac {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

template <typename T>
static std::vector<T> GetListOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const std::vector<T>& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  if (!n.IsSequence()) throw ConfigError(key_path, "expected a list");

  std::vector<T> out;
  out.reserve(n.size());
  for (std::size_t i = 0; i < n.size(); ++i) {
    try {
      out.push_back(n[i].as<T>());
    } catch (const YAML::Exception& e) {
      throw ConfigError(key_path + "[" + std::to_string(i) + "]", e.what());
    }
  }
  return out;
}

static TargetSelectionPolicy ParseSelectionKey(const YAML::Node& parent, const char* key, const std::string& key_path, TargetSelectionPolicy fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "max_confidence") return TargetSelectionPolicy::MaxConfidence;
  if (s == "max_area") return TargetSelectionPolicy::MaxArea;
  throw ConfigError(key_path, "unknown target_selection '" + s + "'. Use: max_confidence | max_area");
}

static RotateMode ParseRotateModeKey(const YAML::Node& parent, const char* key, const std::string& key_path, RotateMode fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "fixed") return RotateMode::Fixed;
  if (s == "proportional") return RotateMode::Proportional;
  throw ConfigError(key_path, "unknown rotate_mode '" + s + "'. Use: fixed | proportional");
}

static ModelLayout ParseLayoutKey(const YAML::Node& parent, const char* key, const std::string& key_path, ModelLayout fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  const std::string s = GetOrKey<std::string>(parent, key, key_path, "");
  if (s == "yolov5") return ModelLayout::YoloV5;
  if (s == "yolov8") return ModelLayout::YoloV8;
  throw ConfigError(key_path, "unknown layout '" + s + "'. Use: yolov5 | yolov8");
}

static void LoadVehicle(const YAML::Node& root, VehicleConfig& cfg) {
  const YAML::Node v = root["vehicle"];
  if (!v) return;
  const std::string p = "vehicle";

  cfg.ip = GetOrKey<std::string>(v, "ip", PathJoin(p, "ip"), cfg.ip);
  cfg.command_port = GetOrKey<int>(v, "command_port", PathJoin(p, "command_port"), cfg.command_port);
  cfg.local_port = GetOrKey<int>(v, "local_port", PathJoin(p, "local_port"), cfg.local_port);
  cfg.reply_timeout_ms = GetOrKey<int>(v, "reply_timeout_ms", PathJoin(p, "reply_timeout_ms"), cfg.reply_timeout_ms);
  cfg.init_commands = GetListOrKey<std::string>(v, "init_commands", PathJoin(p, "init_commands"), cfg.init_commands);
  cfg.auto_takeoff = GetOrKey<bool>(v, "auto_takeoff", PathJoin(p, "auto_takeoff"), cfg.auto_takeoff);
  cfg.shutdown_commands = GetListOrKey<std::string>(v, "shutdown_commands", PathJoin(p, "shutdown_commands"), cfg.shutdown_commands);
}

static void LoadVideo(const YAML::Node& root, VideoConfig& cfg) {
  const YAML::Node v = root["video"];
  if (!v) return;
  const std::string p = "video";

  cfg.url = GetOrKey<std::string>(v, "url", PathJoin(p, "url"), cfg.url);
  cfg.backend = GetOrKey<std::string>(v, "backend", PathJoin(p, "backend"), cfg.backend);
  cfg.reopen_delay_ms = GetOrKey<int>(v, "reopen_delay_ms", PathJoin(p, "reopen_delay_ms"), cfg.reopen_delay_ms);
  cfg.reopen_after_failures = GetOrKey<int>(v, "reopen_after_failures", PathJoin(p, "reopen_after_failures"), cfg.reopen_after_failures);
  cfg.flip_vertical = GetOrKey<bool>(v, "flip_vertical", PathJoin(p, "flip_vertical"), cfg.flip_vertical);
  cfg.flip_horizontal = GetOrKey<bool>(v, "flip_horizontal", PathJoin(p, "flip_horizontal"), cfg.flip_horizontal);
}

static void LoadDetection(const YAML::Node& root, DetectionConfig& cfg) {
  const YAML::Node d = root["detection"];
  if (!d) return;
  const std::string p = "detection";

  cfg.detect_rate = GetOrKey<double>(d, "detect_rate", PathJoin(p, "detect_rate"), cfg.detect_rate);
  cfg.detect_width = GetOrKey<int>(d, "detect_width", PathJoin(p, "detect_width"), cfg.detect_width);
  cfg.confidence_threshold = GetOrKey<float>(d, "confidence_threshold", PathJoin(p, "confidence_threshold"), cfg.confidence_threshold);
  cfg.class_ids = GetListOrKey<int>(d, "class_ids", PathJoin(p, "class_ids"), cfg.class_ids);

  // Class names are an alternative to ids and replace them when present
  const std::string cp = PathJoin(p, "classes");
  const std::vector<std::string> names = GetListOrKey<std::string>(d, "classes", cp, {});
  if (!names.empty()) {
    cfg.class_ids.clear();
    for (const auto& name : names) {
      const auto id = CocoClassId(name);
      if (!id) throw ConfigError(cp, "unknown class name '" + name + "'");
      cfg.class_ids.push_back(*id);
    }
  }

  const YAML::Node model = d["model"];
  const std::string mp = PathJoin(p, "model");
  if (model) {
    cfg.model.path = GetOrKey<std::string>(model, "path", PathJoin(mp, "path"), cfg.model.path);
    cfg.model.input_width = GetOrKey<int>(model, "input_width", PathJoin(mp, "input_width"), cfg.model.input_width);
    cfg.model.input_height = GetOrKey<int>(model, "input_height", PathJoin(mp, "input_height"), cfg.model.input_height);
    cfg.model.layout = ParseLayoutKey(model, "layout", PathJoin(mp, "layout"), cfg.model.layout);
    cfg.model.nms_threshold = GetOrKey<float>(model, "nms_threshold", PathJoin(mp, "nms_threshold"), cfg.model.nms_threshold);
  }
}

static void LoadSteering(const YAML::Node& root, SteeringConfig& cfg) {
  const YAML::Node s = root["steering"];
  if (!s) return;
  const std::string p = "steering";

  cfg.center_tolerance = GetOrKey<float>(s, "center_tolerance", PathJoin(p, "center_tolerance"), cfg.center_tolerance);
  cfg.size_threshold = GetOrKey<float>(s, "size_threshold", PathJoin(p, "size_threshold"), cfg.size_threshold);
  cfg.target_selection = ParseSelectionKey(s, "target_selection", PathJoin(p, "target_selection"), cfg.target_selection);
  cfg.rotate_mode = ParseRotateModeKey(s, "rotate_mode", PathJoin(p, "rotate_mode"), cfg.rotate_mode);
  cfg.rotate_step_deg = GetOrKey<int>(s, "rotate_step_deg", PathJoin(p, "rotate_step_deg"), cfg.rotate_step_deg);
  cfg.rotate_gain_deg = GetOrKey<float>(s, "rotate_gain_deg", PathJoin(p, "rotate_gain_deg"), cfg.rotate_gain_deg);
  cfg.search_rotate_deg = GetOrKey<int>(s, "search_rotate_deg", PathJoin(p, "search_rotate_deg"), cfg.search_rotate_deg);
  cfg.forward_step_cm = GetOrKey<int>(s, "forward_step_cm", PathJoin(p, "forward_step_cm"), cfg.forward_step_cm);
  cfg.land_on_arrival = GetOrKey<bool>(s, "land_on_arrival", PathJoin(p, "land_on_arrival"), cfg.land_on_arrival);
  cfg.default_settle_ms = GetOrKey<int>(s, "default_settle_ms", PathJoin(p, "default_settle_ms"), cfg.default_settle_ms);

  const YAML::Node settle = s["settle_ms"];
  const std::string sp = PathJoin(p, "settle_ms");
  if (settle) {
    if (!settle.IsMap()) throw ConfigError(sp, "expected a map of opcode -> milliseconds");
    for (const auto& kv : settle) {
      const std::string opcode = kv.first.as<std::string>();
      try {
        cfg.settle_ms[opcode] = kv.second.as<int>();
      } catch (const YAML::Exception& e) {
        throw ConfigError(PathJoin(sp, opcode), e.what());
      }
    }
  }
}

static void LoadDisplay(const YAML::Node& root, DisplayConfig& cfg) {
  const YAML::Node d = root["display"];
  if (!d) return;
  const std::string p = "display";

  cfg.enabled = GetOrKey<bool>(d, "enabled", PathJoin(p, "enabled"), cfg.enabled);
  cfg.window_name = GetOrKey<std::string>(d, "window_name", PathJoin(p, "window_name"), cfg.window_name);
  cfg.fps = GetOrKey<int>(d, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.show_boxes = GetOrKey<bool>(d, "show_boxes", PathJoin(p, "show_boxes"), cfg.show_boxes);
  cfg.show_confidence = GetOrKey<bool>(d, "show_confidence", PathJoin(p, "show_confidence"), cfg.show_confidence);
  cfg.show_hud = GetOrKey<bool>(d, "show_hud", PathJoin(p, "show_hud"), cfg.show_hud);
  cfg.hud_log_lines = GetOrKey<int>(d, "hud_log_lines", PathJoin(p, "hud_log_lines"), cfg.hud_log_lines);
}

static void LoadIntake(const YAML::Node& root, IntakeConfig& cfg) {
  const YAML::Node in = root["intake"];
  if (!in) return;
  const std::string p = "intake";

  cfg.stdin_enabled = GetOrKey<bool>(in, "stdin", PathJoin(p, "stdin"), cfg.stdin_enabled);
  cfg.keyboard_enabled = GetOrKey<bool>(in, "keyboard", PathJoin(p, "keyboard"), cfg.keyboard_enabled);
}

static bool ValidPort(int port) { return port > 0 && port <= 65535; }

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.vehicle.ip.empty()) throw ConfigError("vehicle.ip", "must not be empty");
  if (!ValidPort(cfg.vehicle.command_port)) throw ConfigError("vehicle.command_port", "must be in [1, 65535]");
  if (!ValidPort(cfg.vehicle.local_port)) throw ConfigError("vehicle.local_port", "must be in [1, 65535]");
  if (cfg.vehicle.local_port == cfg.vehicle.command_port)
    throw ConfigError("vehicle.local_port", "must differ from vehicle.command_port");
  if (cfg.vehicle.reply_timeout_ms <= 0) throw ConfigError("vehicle.reply_timeout_ms", "must be > 0");

  if (cfg.video.url.empty()) throw ConfigError("video.url", "must not be empty");
  if (cfg.video.backend != "ffmpeg" && cfg.video.backend != "any")
    throw ConfigError("video.backend", "unknown backend '" + cfg.video.backend + "'. Use: ffmpeg | any");
  if (cfg.video.reopen_delay_ms < 0) throw ConfigError("video.reopen_delay_ms", "must be >= 0");
  if (cfg.video.reopen_after_failures < 1) throw ConfigError("video.reopen_after_failures", "must be >= 1");

  if (cfg.detection.detect_rate <= 0.0) throw ConfigError("detection.detect_rate", "must be > 0");
  if (cfg.detection.detect_width <= 0) throw ConfigError("detection.detect_width", "must be > 0");
  if (cfg.detection.confidence_threshold < 0.f || cfg.detection.confidence_threshold > 1.f)
    throw ConfigError("detection.confidence_threshold", "must be in [0, 1]");
  if (cfg.detection.class_ids.empty()) throw ConfigError("detection.class_ids", "must list at least one class");
  if (cfg.detection.model.path.empty()) throw ConfigError("detection.model.path", "must not be empty");
  if (cfg.detection.model.input_width <= 0 || cfg.detection.model.input_height <= 0)
    throw ConfigError("detection.model", "input_width/input_height must be > 0");
  if (cfg.detection.model.nms_threshold < 0.f || cfg.detection.model.nms_threshold > 1.f)
    throw ConfigError("detection.model.nms_threshold", "must be in [0, 1]");

  const auto& s = cfg.steering;
  if (s.center_tolerance < 0.f || s.center_tolerance > 0.5f) throw ConfigError("steering.center_tolerance", "must be in [0, 0.5]");
  if (s.size_threshold <= 0.f || s.size_threshold > 1.f) throw ConfigError("steering.size_threshold", "must be in (0, 1]");
  if (s.rotate_step_deg < 1 || s.rotate_step_deg > 360) throw ConfigError("steering.rotate_step_deg", "must be in [1, 360]");
  if (s.rotate_gain_deg <= 0.f) throw ConfigError("steering.rotate_gain_deg", "must be > 0");
  if (s.search_rotate_deg < 1 || s.search_rotate_deg > 360) throw ConfigError("steering.search_rotate_deg", "must be in [1, 360]");
  if (s.forward_step_cm < 20 || s.forward_step_cm > 500) throw ConfigError("steering.forward_step_cm", "must be in [20, 500]");
  if (s.default_settle_ms < 0) throw ConfigError("steering.default_settle_ms", "must be >= 0");
  for (const auto& kv : s.settle_ms) {
    if (kv.second < 0) throw ConfigError("steering.settle_ms." + kv.first, "must be >= 0");
  }

  if (cfg.display.fps <= 0) throw ConfigError("display.fps", "must be > 0");
  if (cfg.display.hud_log_lines < 0) throw ConfigError("display.hud_log_lines", "must be >= 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadVehicle(root, cfg.vehicle);
  LoadVideo(root, cfg.video);
  LoadDetection(root, cfg.detection);
  LoadSteering(root, cfg.steering);
  LoadDisplay(root, cfg.display);
  LoadIntake(root, cfg.intake);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

SettleTable MakeSettleTable(const SteeringConfig& cfg) {
  SettleTable table(std::chrono::milliseconds(cfg.default_settle_ms));
  for (const auto& kv : cfg.settle_ms) {
    table.set(kv.first, std::chrono::milliseconds(kv.second));
  }
  return table;
}

const char* ToString(TargetSelectionPolicy p) {
  return (p == TargetSelectionPolicy::MaxArea) ? "max_area" : "max_confidence";
}

const char* ToString(RotateMode m) {
  return (m == RotateMode::Proportional) ? "proportional" : "fixed";
}

const char* ToString(ModelLayout l) {
  return (l == ModelLayout::YoloV8) ? "yolov8" : "yolov5";
}

} // namespace dac
