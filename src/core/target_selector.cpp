#include "core/target_selector.hpp"

#include <algorithm>

namespace dac {

std::vector<Detection> FilterDetections(const std::vector<Detection>& dets,
                                        const std::vector<int>& class_ids,
                                        float min_confidence) {
  std::vector<Detection> out;
  out.reserve(dets.size());
  for (const auto& d : dets) {
    if (!(d.confidence > min_confidence)) continue;
    if (std::find(class_ids.begin(), class_ids.end(), d.class_id) == class_ids.end()) continue;
    out.push_back(d);
  }
  return out;
}

std::optional<Candidate> SelectTarget(const std::vector<Candidate>& candidates, TargetSelectionPolicy policy) {
  if (candidates.empty()) return std::nullopt;

  // max_element returns the first of equal maxima
  auto it = candidates.end();
  switch (policy) {
    case TargetSelectionPolicy::MaxConfidence:
      it = std::max_element(candidates.begin(), candidates.end(),
                            [](const Candidate& a, const Candidate& b) { return a.confidence < b.confidence; });
      break;
    case TargetSelectionPolicy::MaxArea:
      it = std::max_element(candidates.begin(), candidates.end(),
                            [](const Candidate& a, const Candidate& b) { return a.bbox.area() < b.bbox.area(); });
      break;
  }

  if (it == candidates.end()) return std::nullopt;
  return *it;
}

} // namespace dac
