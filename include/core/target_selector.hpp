#pragma once

#include <optional>
#include <vector>

#include "core/config.hpp"
#include "core/detections.hpp"

namespace dac {

// Keeps detections whose class is in class_ids and whose confidence is strictly greater than min_confidence
std::vector<Detection> FilterDetections(const std::vector<Detection>& dets,
                                        const std::vector<int>& class_ids,
                                        float min_confidence);

// Picks this cycle's target. MaxConfidence and MaxArea can disagree; ties keep the earlier candidate.
std::optional<Candidate> SelectTarget(const std::vector<Candidate>& candidates, TargetSelectionPolicy policy);

} // namespace dac
