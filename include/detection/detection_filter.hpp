#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "core/config.hpp"
#include "core/detections.hpp"

namespace fw {

// Finite values, confidence in [0, 1], non-negative box inside [0, 1]. Anything else is dropped
// before the tracker sees it.
bool IsWellFormed(const Detection& d);

// Keeps target classes with enough confidence and a plausible box area
class DetectionFilter {
public:
  explicit DetectionFilter(const DetectionConfig& cfg);

  bool keep(const Detection& d) const;

  std::vector<Detection> apply(const std::vector<Detection>& in) const;

private:
  std::unordered_set<std::string> classes_;
  float min_confidence_;
  float min_area_;
  float max_area_;
};

} // namespace fw
