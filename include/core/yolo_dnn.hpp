#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/detector.hpp"

#include <onnxruntime/onnxruntime_cxx_api.h>

namespace dac {

// YOLO exported to ONNX, run on the CPU through ONNX Runtime.
// Construction fails loudly: a missing model file or an unloadable session throws std::runtime_error, so the
// application refuses to start instead of flying with a detector that never sees anything.
class YoloDnn final : public Detector {
public:
  struct Params {
    std::string onnx_path;
    int input_w{640};
    int input_h{640};
    ModelLayout layout{ModelLayout::YoloV5};
    float conf_thresh{0.25f};   // pre-NMS floor, the real threshold is applied by the caller
    float nms_thresh{0.45f};
    int intra_op_threads{1};
  };

  explicit YoloDnn(Params p);

  std::vector<Detection> detect(const cv::Mat& bgr) override;

  const Params& params() const { return p_; }

private:
  Params p_;

  Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "dac-yolo"};
  Ort::SessionOptions sess_opts_{};
  std::unique_ptr<Ort::Session> session_;
  Ort::AllocatorWithDefaultOptions allocator_;

  std::string input_name_;
  std::string output_name_;
};

} // namespace dac
