#include <iostream>
#include <vector>

#include "core/target_selector.hpp"

static dac::Detection Det(int cls, float conf, float w = 10.f, float h = 10.f) {
  dac::Detection d;
  d.class_id = cls;
  d.confidence = conf;
  d.bbox = dac::BBox{0.f, 0.f, w, h};
  return d;
}

static dac::Candidate Cand(float conf, float w, float h, float x = 0.f) {
  dac::Candidate c;
  c.class_id = 0;
  c.confidence = conf;
  c.bbox = dac::BBox{x, 0.f, w, h};
  return c;
}

int main() {
  const std::vector<dac::Detection> dets = {
      Det(0, 0.9f),   // person, kept
      Det(0, 0.5f),   // exactly at threshold, dropped
      Det(2, 0.95f),  // car, not in allow-list
      Det(0, 0.51f),  // kept
      Det(1, 0.8f),
  };

  const auto kept = dac::FilterDetections(dets, {0}, 0.5f);
  if (kept.size() != 2 || kept[0].confidence != 0.9f || kept[1].confidence != 0.51f) {
    std::cerr << "filter must keep class 0 with confidence strictly above 0.5\n";
    return 1;
  }

  const auto multi = dac::FilterDetections(dets, {0, 1, 2}, 0.5f);
  if (multi.size() != 4) {
    std::cerr << "multi-class allow-list should keep 4, got " << multi.size() << "\n";
    return 1;
  }

  if (!dac::FilterDetections(dets, {0}, 0.99f).empty()) {
    std::cerr << "nothing passes a 0.99 threshold\n";
    return 1;
  }

  if (dac::SelectTarget({}, dac::TargetSelectionPolicy::MaxConfidence)) {
    std::cerr << "no candidates must select nothing\n";
    return 1;
  }

  // Confident but small vs. less confident but large: the two policies disagree
  const std::vector<dac::Candidate> cands = {Cand(0.9f, 20.f, 40.f), Cand(0.6f, 100.f, 200.f)};

  auto by_conf = dac::SelectTarget(cands, dac::TargetSelectionPolicy::MaxConfidence);
  if (!by_conf || by_conf->confidence != 0.9f) {
    std::cerr << "max_confidence should pick the 0.9 candidate\n";
    return 1;
  }

  auto by_area = dac::SelectTarget(cands, dac::TargetSelectionPolicy::MaxArea);
  if (!by_area || by_area->confidence != 0.6f) {
    std::cerr << "max_area should pick the large candidate\n";
    return 1;
  }

  // Ties keep the earliest candidate
  const std::vector<dac::Candidate> tied = {Cand(0.7f, 50.f, 50.f, 1.f), Cand(0.7f, 50.f, 50.f, 2.f)};
  auto t1 = dac::SelectTarget(tied, dac::TargetSelectionPolicy::MaxConfidence);
  auto t2 = dac::SelectTarget(tied, dac::TargetSelectionPolicy::MaxArea);
  if (!t1 || !t2 || t1->bbox.x != 1.f || t2->bbox.x != 1.f) {
    std::cerr << "tie must resolve to the first candidate\n";
    return 1;
  }

  return 0;
}
