#include <cmath>
#include <iostream>
#include <vector>

#include "core/coordinate_mapper.hpp"

static bool Near(double a, double b, double tol = 1e-3) { return std::fabs(a - b) <= tol; }

static bool SameBox(const dac::BBox& a, const dac::BBox& b, double tol = 1e-3) {
  return Near(a.x, b.x, tol) && Near(a.y, b.y, tol) && Near(a.w, b.w, tol) && Near(a.h, b.h, tol);
}

int main() {
  // 960x720 stream downscaled to 640 wide keeps 4:3
  const cv::Size src(960, 720);
  const cv::Size det = dac::DetectionSizeFor(src, 640);
  if (det != cv::Size(640, 480)) {
    std::cerr << "expected 640x480 detection size, got " << det << "\n";
    return 1;
  }
  if (!dac::DetectionSizeFor(cv::Size(), 640).empty() || !dac::DetectionSizeFor(src, 0).empty()) {
    std::cerr << "invalid input must give an empty detection size\n";
    return 1;
  }

  const dac::ScaleFactors s = dac::ComputeScale(src, det);
  if (!s.valid() || !Near(s.fx, 1.5) || !Near(s.fy, 1.5)) {
    std::cerr << "scale factors should be 1.5 / 1.5\n";
    return 1;
  }

  // Non-uniform factors are kept independent
  const dac::ScaleFactors ns = dac::ComputeScale(cv::Size(1280, 720), cv::Size(640, 480));
  if (!Near(ns.fx, 2.0) || !Near(ns.fy, 1.5)) {
    std::cerr << "independent horizontal/vertical factors expected\n";
    return 1;
  }
  if (dac::ComputeScale(src, cv::Size(0, 0)).valid()) {
    std::cerr << "zero detection size must give invalid factors\n";
    return 1;
  }

  const dac::BBox in_det{100.f, 50.f, 200.f, 120.f};
  const dac::BBox in_src = dac::MapToSource(in_det, ns, cv::Size(1280, 720));
  if (!SameBox(in_src, dac::BBox{200.f, 75.f, 400.f, 180.f})) {
    std::cerr << "scaled box mismatch\n";
    return 1;
  }

  // Detection -> source -> detection returns the original box
  const dac::BBox back = dac::MapToDetection(in_src, ns);
  if (!SameBox(back, in_det)) {
    std::cerr << "inverse mapping did not return the original box\n";
    return 1;
  }

  // Boxes hanging off the edge are clamped to the source frame
  const dac::BBox off_edge{600.f, 400.f, 100.f, 200.f};
  const dac::BBox clamped = dac::MapToSource(off_edge, s, src);
  if (clamped.x < 0.f || clamped.y < 0.f || clamped.x2() > 960.f + 1e-3f || clamped.y2() > 720.f + 1e-3f) {
    std::cerr << "mapped box escaped the source frame\n";
    return 1;
  }
  if (!Near(clamped.x, 900.0) || !Near(clamped.w, 60.0) || !Near(clamped.y, 600.0) || !Near(clamped.h, 120.0)) {
    std::cerr << "clamped box should keep its visible part\n";
    return 1;
  }

  const dac::BBox negative{-20.f, -10.f, 40.f, 20.f};
  const dac::BBox neg_src = dac::MapToSource(negative, s, src);
  if (!Near(neg_src.x, 0.0) || !Near(neg_src.y, 0.0) || !Near(neg_src.w, 30.0) || !Near(neg_src.h, 15.0)) {
    std::cerr << "negative corner not clamped to zero\n";
    return 1;
  }

  std::vector<dac::Detection> dets(2);
  dets[0].bbox = in_det;
  dets[0].class_id = 0;
  dets[0].confidence = 0.9f;
  dets[1].bbox = off_edge;
  dets[1].class_id = 2;
  dets[1].confidence = 0.6f;

  const auto cands = dac::MapToSource(dets, s, src);
  if (cands.size() != 2 || cands[1].class_id != 2 || !Near(cands[0].confidence, 0.9) ||
      !SameBox(cands[0].bbox, dac::BBox{150.f, 75.f, 300.f, 180.f})) {
    std::cerr << "candidate mapping lost class/confidence or box\n";
    return 1;
  }

  return 0;
}
