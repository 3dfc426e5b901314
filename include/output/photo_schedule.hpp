#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "core/config.hpp"
#include "core/detections.hpp"
#include "core/wall_clock.hpp"

namespace fw {

/*
    Decides when a feeder photo is due and hands out the session-wide photo number.
    A photo is due when saving is enabled, birds are on the frame, and at least
    min_save_interval_seconds passed since the last photo (the first one is due immediately).
*/
class PhotoSchedule {
public:
  explicit PhotoSchedule(FrameSavingConfig cfg) : cfg_(std::move(cfg)) {}

  bool due(WallSeconds now, int birds_on_frame) const {
    if (!cfg_.enable_photo_save || birds_on_frame <= 0) return false;
    if (!has_saved_) return true;
    return now - last_save_ >= cfg_.min_save_interval_seconds;
  }

  // Records a save at 'now' and returns its number, 1 for the first photo
  std::uint64_t claim(WallSeconds now) {
    has_saved_ = true;
    last_save_ = now;
    return ++photo_count_;
  }

  // "{timestamp}" is the local capture time, "{bird_count}" the photo number, so names never collide
  std::string filename(WallSeconds now, std::uint64_t photo_number) const {
    std::string name = ExpandPattern(cfg_.photo_filename_pattern, "timestamp", FormatLocalTime(now, "%Y%m%d_%H%M%S"));
    return ExpandPattern(name, "bird_count", std::to_string(photo_number));
  }

  std::uint64_t photo_count() const { return photo_count_; }

private:
  FrameSavingConfig cfg_;
  bool has_saved_{false};
  WallSeconds last_save_{0.0};
  std::uint64_t photo_count_{0};
};

} // namespace fw
