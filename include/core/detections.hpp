#pragma once

#include <cstdint>
#include <vector>

namespace dac {

// Axis-aligned box, top-left corner plus size, in pixels of whichever image it was produced for
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};

  float x2() const { return x + w; }
  float y2() const { return y + h; }
  float center_x() const { return x + 0.5f * w; }
  float center_y() const { return y + 0.5f * h; }
  float area() const { return w * h; }
};

// Detector output, in detection-resolution pixel coordinates. Lives for one detection cycle.
struct Detection {
  BBox bbox;
  std::int32_t class_id{-1};
  float confidence{0.f};
};

// A detection that passed the class/confidence filter and was mapped into source-frame pixel coordinates
struct Candidate {
  BBox bbox;
  std::int32_t class_id{-1};
  float confidence{0.f};
};

} // namespace dac
