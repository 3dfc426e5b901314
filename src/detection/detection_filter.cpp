#include "detection/detection_filter.hpp"

#include <cmath>

namespace fw {

static bool InUnit(float v) {
  return std::isfinite(v) && v >= 0.f && v <= 1.f;
}

bool IsWellFormed(const Detection& d) {
  if (!InUnit(d.confidence)) return false;
  const BBox& b = d.bbox;
  if (!InUnit(b.x) || !InUnit(b.y) || !InUnit(b.w) || !InUnit(b.h)) return false;
  return true;
}

DetectionFilter::DetectionFilter(const DetectionConfig& cfg)
    : classes_(cfg.target_classes.begin(), cfg.target_classes.end()),
      min_confidence_(cfg.min_confidence),
      min_area_(cfg.min_bbox_size),
      max_area_(cfg.max_bbox_size) {}

bool DetectionFilter::keep(const Detection& d) const {
  if (classes_.find(d.label) == classes_.end()) return false;
  if (d.confidence < min_confidence_) return false;
  const float area = d.bbox.area();
  return area >= min_area_ && area <= max_area_;
}

std::vector<Detection> DetectionFilter::apply(const std::vector<Detection>& in) const {
  std::vector<Detection> out;
  out.reserve(in.size());
  for (const auto& d : in) {
    if (keep(d)) out.push_back(d);
  }
  return out;
}

} // namespace fw
