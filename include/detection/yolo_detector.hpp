#pragma once

#include <memory>
#include <string>
#include <vector>

#include <onnxruntime/onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/detections.hpp"

namespace fw {

// YOLO (v8-style head, 4 box rows + one score row per class) on ONNX Runtime, CPU only.
// Boxes come back normalized to [0,1] of the input image, labels as COCO names.
class YoloDetector {
public:
  struct Params {
    std::string onnx_path;
    int input_w{640};
    int input_h{640};
    float conf_thresh{0.25f};
    float nms_thresh{0.45f};
    int intra_op_threads{1};
  };

  static Params ParamsFrom(const ModelConfig& model, const DetectionConfig& det);

  explicit YoloDetector(Params p);

  bool is_loaded() const { return loaded_; }

  // Empty on any inference failure, the caller treats that like a frame with no birds
  std::vector<Detection> detect(const cv::Mat& bgr);

private:
  Params p_;
  bool loaded_{false};

  Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "feeder-watch"};
  Ort::SessionOptions sess_opts_{};
  std::unique_ptr<Ort::Session> session_;
  Ort::AllocatorWithDefaultOptions allocator_;

  std::string input_name_;
  std::string output_name_;
  std::vector<float> input_tensor_;
};

} // namespace fw
