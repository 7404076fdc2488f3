#pragma once

#include <optional>
#include <string>
#include <vector>

// Class names of the 80-class COCO models (yolov5s / yolov8n exports). Index == class id.

namespace dac {

inline const std::vector<std::string>& CocoLabels() {
  static const std::vector<std::string> labels = {
    "person","bicycle","car","motorcycle","airplane","bus","train","truck","boat",
    "traffic light","fire hydrant","stop sign","parking meter","bench","bird","cat","dog",
    "horse","sheep","cow","elephant","bear","zebra","giraffe","backpack","umbrella",
    "handbag","tie","suitcase","frisbee","skis","snowboard","sports ball","kite",
    "baseball bat","baseball glove","skateboard","surfboard","tennis racket","bottle",
    "wine glass","cup","fork","knife","spoon","bowl","banana","apple","sandwich","orange",
    "broccoli","carrot","hot dog","pizza","donut","cake","chair","couch","potted plant",
    "bed","dining table","toilet","tv","laptop","mouse","remote","keyboard","cell phone",
    "microwave","oven","toaster","sink","refrigerator","book","clock","vase","scissors",
    "teddy bear","hair drier","toothbrush"
  };
  return labels;
}

inline std::string CocoClassName(int class_id) {
  const auto& labels = CocoLabels();
  if (class_id < 0 || class_id >= static_cast<int>(labels.size()))
    return "class " + std::to_string(class_id);
  return labels[class_id];
}

inline std::optional<int> CocoClassId(const std::string& name) {
  const auto& labels = CocoLabels();
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] == name) return static_cast<int>(i);
  }
  return std::nullopt;
}

} // namespace dac
