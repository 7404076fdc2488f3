#include "core/yolo_dnn.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace dac {

static inline float Clamp(float v, float lo, float hi) {
  return std::max(lo, std::min(hi, v));
}

static inline float IoUBox(const BBox& a, const BBox& b) {
  const float ix1 = std::max(a.x, b.x);
  const float iy1 = std::max(a.y, b.y);
  const float ix2 = std::min(a.x2(), b.x2());
  const float iy2 = std::min(a.y2(), b.y2());

  const float iw = std::max(0.f, ix2 - ix1);
  const float ih = std::max(0.f, iy2 - iy1);
  const float inter = iw * ih;

  const float ua = a.area() + b.area() - inter;
  return (ua <= 0.f) ? 0.f : (inter / ua);
}

YoloDnn::YoloDnn(Params p) : p_(std::move(p)) {
  if (p_.onnx_path.empty() || !std::ifstream(p_.onnx_path).good()) {
    throw std::runtime_error("YoloDnn: model file not found: '" + p_.onnx_path + "'");
  }
  if (p_.input_w <= 0 || p_.input_h <= 0) {
    throw std::runtime_error("YoloDnn: input size must be > 0");
  }

  try {
    sess_opts_.SetIntraOpNumThreads(p_.intra_op_threads);
    sess_opts_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    session_ = std::make_unique<Ort::Session>(env_, p_.onnx_path.c_str(), sess_opts_);

    {
      auto in = session_->GetInputNameAllocated(0, allocator_);
      input_name_ = in ? std::string(in.get()) : std::string{};
    }
    {
      auto out = session_->GetOutputNameAllocated(0, allocator_);
      output_name_ = out ? std::string(out.get()) : std::string{};
    }
  } catch (const Ort::Exception& e) {
    throw std::runtime_error("YoloDnn: ONNX Runtime could not load '" + p_.onnx_path + "': " + e.what());
  }

  if (input_name_.empty() || output_name_.empty()) {
    throw std::runtime_error("YoloDnn: model '" + p_.onnx_path + "' has no named input/output");
  }
}

std::vector<Detection> YoloDnn::detect(const cv::Mat& bgr) {
  std::vector<Detection> out;
  if (bgr.empty()) return out;

  cv::Mat resized;
  cv::resize(bgr, resized, cv::Size(p_.input_w, p_.input_h), 0, 0, cv::INTER_LINEAR);

  cv::Mat rgb;
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);

  cv::Mat f32;
  rgb.convertTo(f32, CV_32F, 1.0 / 255.0);

  // HWC -> CHW
  std::vector<float> input_tensor(static_cast<std::size_t>(3) * p_.input_h * p_.input_w);
  {
    std::vector<cv::Mat> ch(3);
    cv::split(f32, ch);
    const std::size_t hw = static_cast<std::size_t>(p_.input_h) * p_.input_w;
    for (std::size_t c = 0; c < 3; ++c) {
      std::memcpy(input_tensor.data() + c * hw, ch[c].ptr<float>(), hw * sizeof(float));
    }
  }

  std::array<int64_t, 4> in_shape{1, 3, p_.input_h, p_.input_w};
  auto mem_info = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

  Ort::Value in = Ort::Value::CreateTensor<float>(
      mem_info, input_tensor.data(), input_tensor.size(), in_shape.data(), in_shape.size());

  const char* in_names[] = {input_name_.c_str()};
  const char* out_names[] = {output_name_.c_str()};

  // Ort::Exception propagates; the caller treats it as a failed cycle
  std::vector<Ort::Value> ort_out = session_->Run(Ort::RunOptions{nullptr}, in_names, &in, 1, out_names, 1);

  if (ort_out.empty() || !ort_out[0].IsTensor()) return out;

  auto& t = ort_out[0];
  auto shape = t.GetTensorTypeAndShapeInfo().GetShape();
  if (shape.size() != 3 || shape[0] != 1) return out;

  const float* data = t.GetTensorData<float>();
  const int A = static_cast<int>(shape[1]);
  const int B = static_cast<int>(shape[2]);

  // yolov5 exports rows of attributes [N, C], yolov8 exports [C, N]; the attribute axis is the short one
  const bool layout_CxN = (A < B);
  const int C = layout_CxN ? A : B;
  const int N = layout_CxN ? B : A;

  const bool has_objectness = (p_.layout == ModelLayout::YoloV5);
  const int first_class = has_objectness ? 5 : 4;
  const int num_classes = C - first_class;
  if (num_classes < 1) return out;

  auto at = [&](int c, int n) -> float {
    if (layout_CxN) return data[c * N + n];
    return data[n * C + c];
  };

  // Model space -> space of the image we were given
  const float sx = static_cast<float>(bgr.cols) / static_cast<float>(p_.input_w);
  const float sy = static_cast<float>(bgr.rows) / static_cast<float>(p_.input_h);

  std::vector<Detection> cands;
  cands.reserve(256);

  for (int i = 0; i < N; ++i) {
    const float objectness = has_objectness ? at(4, i) : 1.f;
    if (objectness < p_.conf_thresh) continue;

    int best_cls = -1;
    float best = 0.f;
    for (int c = 0; c < num_classes; ++c) {
      const float s = at(first_class + c, i);
      if (s > best) { best = s; best_cls = c; }
    }

    const float score = best * objectness;
    if (best_cls < 0 || score < p_.conf_thresh) continue;

    const float cx = at(0, i);
    const float cy = at(1, i);
    const float w  = at(2, i);
    const float h  = at(3, i);

    BBox bb;
    bb.x = Clamp((cx - 0.5f * w) * sx, 0.f, static_cast<float>(bgr.cols));
    bb.y = Clamp((cy - 0.5f * h) * sy, 0.f, static_cast<float>(bgr.rows));
    bb.w = Clamp(w * sx, 0.f, static_cast<float>(bgr.cols) - bb.x);
    bb.h = Clamp(h * sy, 0.f, static_cast<float>(bgr.rows) - bb.y);
    if (bb.w <= 1.f || bb.h <= 1.f) continue;

    Detection d;
    d.bbox = bb;
    d.class_id = best_cls;
    d.confidence = score;
    cands.push_back(d);
  }

  std::sort(cands.begin(), cands.end(),
            [](const Detection& a, const Detection& b) { return a.confidence > b.confidence; });

  // Greedy per-class NMS
  out.reserve(cands.size());
  for (const auto& c : cands) {
    bool keep = true;
    for (const auto& k : out) {
      if (k.class_id == c.class_id && IoUBox(c.bbox, k.bbox) > p_.nms_thresh) { keep = false; break; }
    }
    if (keep) out.push_back(c);
  }

  return out;
}

} // namespace dac
