#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "output/photo_schedule.hpp"

namespace fw {

// Writes feeder photos as JPEG into <session>/photos/. Failures are logged, never thrown
class PhotoSaver {
public:
  PhotoSaver(FrameSavingConfig cfg, std::filesystem::path session_dir);

  // Saves if the schedule says a photo is due. Returns true when a file was written
  bool maybe_save(const cv::Mat& bgr, WallSeconds now, int birds_on_frame);

  std::uint64_t saved() const { return saved_; }
  const std::filesystem::path& photos_dir() const { return photos_dir_; }

private:
  PhotoSchedule schedule_;
  std::filesystem::path photos_dir_;
  std::uint64_t saved_{0};
};

} // namespace fw
