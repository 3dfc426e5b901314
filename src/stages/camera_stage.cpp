#include "stages/camera_stage.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/wall_clock.hpp"

namespace fw {

CameraStage::CameraStage(CameraConfig cfg, std::shared_ptr<BoundedQueue<Frame>> out)
    : Stage("camera_stage"), cfg_(std::move(cfg)), out_(std::move(out)) {}

void CameraStage::run(const StopToken& global, const std::atomic_bool& local) {
  cv::VideoCapture cap(cfg_.device_index);

  // Closing the queue lets the consumer notice there will be no frames
  if (!cap.isOpened()) {
    std::cerr << "[camera] cannot open device " << cfg_.device_index << std::endl;
    open_failed_.store(true, std::memory_order_relaxed);
    out_->close();
    return;
  }

  cap.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  cap.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  cap.set(cv::CAP_PROP_FPS, cfg_.fps);

  while (!global.stop_requested() && !local.load(std::memory_order_relaxed)) {
    cv::Mat img;

    // Read one frame, if unable, try again
    if (!cap.read(img)) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      continue;
    }

    if (cfg_.flip_vertical) cv::flip(img, img, 0);
    if (cfg_.flip_horizontal) cv::flip(img, img, 1);

    Frame f;
    f.capture_time = NowSeconds();
    f.sequence_id = next_id_.fetch_add(1, std::memory_order_relaxed);
    f.image = std::move(img);

    out_->try_push(std::move(f));
  }

  out_->close();
}

} // namespace fw
