#include "output/photo_saver.hpp"

#include <iostream>
#include <system_error>
#include <utility>

#include <opencv2/imgcodecs.hpp>

namespace fw {

PhotoSaver::PhotoSaver(FrameSavingConfig cfg, std::filesystem::path session_dir)
    : schedule_(std::move(cfg)), photos_dir_(std::move(session_dir) / "photos") {}

bool PhotoSaver::maybe_save(const cv::Mat& bgr, WallSeconds now, int birds_on_frame) {
  if (bgr.empty() || !schedule_.due(now, birds_on_frame)) return false;

  std::error_code ec;
  std::filesystem::create_directories(photos_dir_, ec);
  if (ec) {
    std::cerr << "[photo] cannot create " << photos_dir_ << ": " << ec.message() << std::endl;
    return false;
  }

  // Claimed before writing so a failed write still waits out the interval
  const auto number = schedule_.claim(now);
  const auto path = photos_dir_ / schedule_.filename(now, number);

  bool ok = false;
  try {
    ok = cv::imwrite(path.string(), bgr);
  } catch (const cv::Exception& e) {
    std::cerr << "[photo] imwrite threw: " << e.what() << std::endl;
  }

  if (!ok) {
    std::cerr << "[photo] failed to write " << path << std::endl;
    return false;
  }

  ++saved_;
  std::cout << "[photo] saved " << path.string() << " (photo #" << number << ")" << std::endl;
  return true;
}

} // namespace fw
