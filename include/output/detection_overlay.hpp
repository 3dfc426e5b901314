#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "core/detections.hpp"
#include "tracking/session_counters.hpp"

namespace fw {

struct OverlayInfo {
  std::uint64_t frame_index{0};
  double fps{0.0};
  CounterSnapshot counters{};
  std::optional<double> temperature_c;
  WallSeconds now{0.0};
};

// Draws detection boxes and a stats panel onto a BGR frame in place
class DetectionOverlay {
public:
  DetectionOverlay() = default;

  void draw(cv::Mat& bgr, const std::vector<Detection>& detections, const OverlayInfo& info) const;

private:
  void draw_boxes(cv::Mat& bgr, const std::vector<Detection>& detections) const;
  void draw_panel(cv::Mat& bgr, const OverlayInfo& info) const;
};

} // namespace fw
