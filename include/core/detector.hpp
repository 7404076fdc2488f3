#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/detections.hpp"

namespace dac {

// Object detector seam. Given a BGR raster, returns boxes in that raster's pixel coordinates, with a confidence and
// a class index each. The call is synchronous; filtering by class and confidence is left to the caller.
class Detector {
public:
  virtual ~Detector() = default;

  virtual std::vector<Detection> detect(const cv::Mat& bgr) = 0;
};

} // namespace dac
