#include "output/detection_overlay.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>

#include "core/wall_clock.hpp"

namespace fw {

static const cv::Scalar kBoxColor(0, 255, 0);
static const cv::Scalar kTextColor(255, 255, 255);

void DetectionOverlay::draw(cv::Mat& bgr, const std::vector<Detection>& detections, const OverlayInfo& info) const {
  if (bgr.empty()) return;
  draw_boxes(bgr, detections);
  draw_panel(bgr, info);
}

// Boxes are normalized, scale them to the image
void DetectionOverlay::draw_boxes(cv::Mat& bgr, const std::vector<Detection>& detections) const {
  const float W = static_cast<float>(bgr.cols);
  const float H = static_cast<float>(bgr.rows);

  for (const auto& d : detections) {
    const cv::Rect r(static_cast<int>(d.bbox.x * W), static_cast<int>(d.bbox.y * H),
                     static_cast<int>(d.bbox.w * W), static_cast<int>(d.bbox.h * H));
    cv::rectangle(bgr, r, kBoxColor, 2);

    std::ostringstream oss;
    oss << d.label << " " << std::fixed << std::setprecision(2) << d.confidence;

    int baseline = 0;
    const auto size = cv::getTextSize(oss.str(), cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);
    const int ty = std::max(r.y, size.height + 4);
    cv::rectangle(bgr, cv::Rect(r.x, ty - size.height - 4, size.width + 4, size.height + 4), kBoxColor, cv::FILLED);
    cv::putText(bgr, oss.str(), cv::Point(r.x + 2, ty - 2), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
  }
}

// Semi-transparent black box in the top-left corner with one stat per line
void DetectionOverlay::draw_panel(cv::Mat& bgr, const OverlayInfo& info) const {
  std::vector<std::string> lines;
  {
    std::ostringstream oss;
    oss << "Frame: " << info.frame_index;
    lines.push_back(oss.str());
  }
  {
    std::ostringstream oss;
    oss << "FPS: " << std::fixed << std::setprecision(1) << info.fps;
    lines.push_back(oss.str());
  }
  lines.push_back("Birds: " + std::to_string(info.counters.current_frame_count));
  lines.push_back("Active: " + std::to_string(info.counters.current_active));
  lines.push_back("Unique: " + std::to_string(info.counters.total_unique));
  lines.push_back("Visits: " + std::to_string(info.counters.total_visits));
  if (info.temperature_c) {
    std::ostringstream oss;
    oss << "CPU: " << std::fixed << std::setprecision(1) << *info.temperature_c << "C";
    lines.push_back(oss.str());
  }
  lines.push_back("Time: " + FormatLocalTime(info.now, "%H:%M:%S"));

  const int line = 20;
  const int panel_w = 180;
  const int panel_h = 10 + line * static_cast<int>(lines.size());
  const cv::Rect area(0, 0, std::min(panel_w, bgr.cols), std::min(panel_h, bgr.rows));

  cv::Mat roi = bgr(area);
  cv::Mat shade(roi.size(), roi.type(), cv::Scalar(0, 0, 0));
  cv::addWeighted(shade, 0.6, roi, 0.4, 0.0, roi);

  int y = line;
  for (const auto& s : lines) {
    cv::putText(bgr, s, cv::Point(8, y), cv::FONT_HERSHEY_SIMPLEX, 0.5, kTextColor, 1, cv::LINE_AA);
    y += line;
  }
}

} // namespace fw
