#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/detections.hpp"

/*
    Detection runs on a downscaled copy of the frame. Boxes come back in detection-resolution pixels and have to be
    brought back to source-frame pixels before the steering policy can reason about offsets and sizes.

    Only independent horizontal/vertical scaling is modelled, no rotation or lens correction:
        fx = W_src / W_det,  fy = H_src / H_det
    computed from the sizes actually used for the resize, never from configuration.
*/

namespace dac {

struct ScaleFactors {
  double fx{1.0};
  double fy{1.0};

  bool valid() const { return fx > 0.0 && fy > 0.0; }
};

// Detection-resolution size for a source frame: width fixed to detect_width, height keeps the aspect ratio.
// Returns an empty size for an empty source or non-positive detect_width.
cv::Size DetectionSizeFor(const cv::Size& src, int detect_width);

// Scale factors from detection space to source space. Invalid (zero) factors for empty sizes.
ScaleFactors ComputeScale(const cv::Size& src, const cv::Size& det);

// Detection space -> source space, clamped to [0, W_src] x [0, H_src]
BBox MapToSource(const BBox& det_box, const ScaleFactors& s, const cv::Size& src);

// Source space -> detection space (inverse scaling, no clamping)
BBox MapToDetection(const BBox& src_box, const ScaleFactors& s);

Candidate MapToSource(const Detection& d, const ScaleFactors& s, const cv::Size& src);

std::vector<Candidate> MapToSource(const std::vector<Detection>& dets, const ScaleFactors& s, const cv::Size& src);

} // namespace dac
