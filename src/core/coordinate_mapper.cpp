#include "core/coordinate_mapper.hpp"

#include <algorithm>
#include <cmath>

namespace dac {

static inline float Clamp(float v, float lo, float hi) {
  return std::max(lo, std::min(hi, v));
}

cv::Size DetectionSizeFor(const cv::Size& src, int detect_width) {
  if (src.width <= 0 || src.height <= 0 || detect_width <= 0) return cv::Size();

  const double ratio = static_cast<double>(detect_width) / static_cast<double>(src.width);
  const int h = std::max(1, static_cast<int>(std::lround(src.height * ratio)));
  return cv::Size(detect_width, h);
}

ScaleFactors ComputeScale(const cv::Size& src, const cv::Size& det) {
  ScaleFactors s;
  if (src.width <= 0 || src.height <= 0 || det.width <= 0 || det.height <= 0) {
    s.fx = 0.0;
    s.fy = 0.0;
    return s;
  }
  s.fx = static_cast<double>(src.width) / static_cast<double>(det.width);
  s.fy = static_cast<double>(src.height) / static_cast<double>(det.height);
  return s;
}

BBox MapToSource(const BBox& det_box, const ScaleFactors& s, const cv::Size& src) {
  const float W = static_cast<float>(src.width);
  const float H = static_cast<float>(src.height);

  // Clamp the corners, not x/w separately, so a box hanging off one edge keeps its visible part
  const float x1 = Clamp(static_cast<float>(det_box.x * s.fx), 0.f, W);
  const float y1 = Clamp(static_cast<float>(det_box.y * s.fy), 0.f, H);
  const float x2 = Clamp(static_cast<float>(det_box.x2() * s.fx), 0.f, W);
  const float y2 = Clamp(static_cast<float>(det_box.y2() * s.fy), 0.f, H);

  BBox out;
  out.x = x1;
  out.y = y1;
  out.w = std::max(0.f, x2 - x1);
  out.h = std::max(0.f, y2 - y1);
  return out;
}

BBox MapToDetection(const BBox& src_box, const ScaleFactors& s) {
  BBox out;
  if (!s.valid()) return out;
  out.x = static_cast<float>(src_box.x / s.fx);
  out.y = static_cast<float>(src_box.y / s.fy);
  out.w = static_cast<float>(src_box.w / s.fx);
  out.h = static_cast<float>(src_box.h / s.fy);
  return out;
}

Candidate MapToSource(const Detection& d, const ScaleFactors& s, const cv::Size& src) {
  Candidate c;
  c.bbox = MapToSource(d.bbox, s, src);
  c.class_id = d.class_id;
  c.confidence = d.confidence;
  return c;
}

std::vector<Candidate> MapToSource(const std::vector<Detection>& dets, const ScaleFactors& s, const cv::Size& src) {
  std::vector<Candidate> out;
  out.reserve(dets.size());
  for (const auto& d : dets) out.push_back(MapToSource(d, s, src));
  return out;
}

} // namespace dac
