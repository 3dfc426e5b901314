#include "detection/yolo_detector.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <utility>

#include <opencv2/imgproc.hpp>

#include "detection/labels/coco_labels.hpp"

namespace fw {

static inline float Clamp01(float v) {
  return std::max(0.f, std::min(1.f, v));
}

static float IoU(const BBox& a, const BBox& b) {
  const float ix1 = std::max(a.x, b.x);
  const float iy1 = std::max(a.y, b.y);
  const float ix2 = std::min(a.x + a.w, b.x + b.w);
  const float iy2 = std::min(a.y + a.h, b.y + b.h);

  const float inter = std::max(0.f, ix2 - ix1) * std::max(0.f, iy2 - iy1);
  const float ua = a.area() + b.area() - inter;
  return (ua <= 0.f) ? 0.f : (inter / ua);
}

YoloDetector::Params YoloDetector::ParamsFrom(const ModelConfig& model, const DetectionConfig& det) {
  Params p;
  p.onnx_path = model.path;
  p.input_w = model.input_width;
  p.input_h = model.input_height;
  p.conf_thresh = det.min_confidence;
  p.nms_thresh = model.nms_threshold;
  return p;
}

YoloDetector::YoloDetector(Params p) : p_(std::move(p)) {
  try {
    sess_opts_.SetIntraOpNumThreads(p_.intra_op_threads);
    sess_opts_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    session_ = std::make_unique<Ort::Session>(env_, p_.onnx_path.c_str(), sess_opts_);

    {
      auto in = session_->GetInputNameAllocated(0, allocator_);
      input_name_ = in ? std::string(in.get()) : std::string{};
    }
    {
      auto out = session_->GetOutputNameAllocated(0, allocator_);
      output_name_ = out ? std::string(out.get()) : std::string{};
    }

    loaded_ = !input_name_.empty() && !output_name_.empty();
  } catch (const Ort::Exception& e) {
    std::cerr << "[detector] ONNX Runtime init failed for '" << p_.onnx_path << "': " << e.what() << std::endl;
    loaded_ = false;
  }

  input_tensor_.resize(static_cast<std::size_t>(3) * p_.input_h * p_.input_w);
}

std::vector<Detection> YoloDetector::detect(const cv::Mat& bgr) {
  std::vector<Detection> out;
  if (!loaded_ || !session_ || bgr.empty()) return out;

  // Plain stretch to the network size, so normalized network coordinates are normalized image coordinates
  cv::Mat resized;
  cv::resize(bgr, resized, cv::Size(p_.input_w, p_.input_h), 0, 0, cv::INTER_LINEAR);

  cv::Mat rgb;
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);

  cv::Mat f32;
  rgb.convertTo(f32, CV_32F, 1.0 / 255.0);

  {
    std::vector<cv::Mat> ch(3);
    cv::split(f32, ch);
    const int hw = p_.input_h * p_.input_w;
    for (int c = 0; c < 3; ++c) {
      std::memcpy(input_tensor_.data() + c * hw, ch[c].data, hw * sizeof(float));
    }
  }

  std::array<int64_t, 4> in_shape{1, 3, p_.input_h, p_.input_w};
  auto mem_info = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

  Ort::Value in = Ort::Value::CreateTensor<float>(
      mem_info, input_tensor_.data(), input_tensor_.size(), in_shape.data(), in_shape.size());

  const char* in_names[] = {input_name_.c_str()};
  const char* out_names[] = {output_name_.c_str()};

  std::vector<Ort::Value> ort_out;
  try {
    ort_out = session_->Run(Ort::RunOptions{nullptr}, in_names, &in, 1, out_names, 1);
  } catch (const Ort::Exception& e) {
    std::cerr << "[detector] ORT Run failed: " << e.what() << std::endl;
    return out;
  }

  if (ort_out.empty() || !ort_out[0].IsTensor()) return out;

  auto& t = ort_out[0];
  auto shape = t.GetTensorTypeAndShapeInfo().GetShape();
  if (shape.size() != 3 || shape[0] != 1) return out;

  const float* data = t.GetTensorData<float>();
  const int A = static_cast<int>(shape[1]);
  const int B = static_cast<int>(shape[2]);

  // Exports differ: [1, 4+classes, anchors] or [1, anchors, 4+classes]
  const bool layout_CxN = (A < B);
  const int C = layout_CxN ? A : B;
  const int N = layout_CxN ? B : A;
  if (C < 5) return out;

  const int num_classes = C - 4;

  auto at = [&](int c, int n) -> float {
    if (layout_CxN) return data[c * N + n];
    return data[n * C + c];
  };

  const float inv_w = 1.f / static_cast<float>(p_.input_w);
  const float inv_h = 1.f / static_cast<float>(p_.input_h);

  struct Cand { BBox box; int cls; float score; };
  std::vector<Cand> cands;
  cands.reserve(256);

  for (int i = 0; i < N; ++i) {
    int best_cls = -1;
    float best = 0.f;
    for (int c = 0; c < num_classes; ++c) {
      const float s = at(4 + c, i);
      if (s > best) { best = s; best_cls = c; }
    }
    if (best < p_.conf_thresh) continue;

    const float cx = at(0, i) * inv_w;
    const float cy = at(1, i) * inv_h;
    const float w  = at(2, i) * inv_w;
    const float h  = at(3, i) * inv_h;

    BBox bb;
    bb.x = Clamp01(cx - 0.5f * w);
    bb.y = Clamp01(cy - 0.5f * h);
    bb.w = std::min(w, 1.f - bb.x);
    bb.h = std::min(h, 1.f - bb.y);
    if (bb.w <= 0.f || bb.h <= 0.f) continue;

    cands.push_back({bb, best_cls, best});
  }

  std::sort(cands.begin(), cands.end(),
            [](const Cand& a, const Cand& b) { return a.score > b.score; });

  // Class-wise NMS: a bird next to a feeder post should survive
  std::vector<Cand> kept;
  kept.reserve(cands.size());
  for (const auto& c : cands) {
    bool ok = true;
    for (const auto& k : kept) {
      if (k.cls == c.cls && IoU(c.box, k.box) > p_.nms_thresh) { ok = false; break; }
    }
    if (ok) kept.push_back(c);
  }

  out.reserve(kept.size());
  for (const auto& k : kept) {
    Detection d;
    d.label = CocoClassName(k.cls);
    d.confidence = k.score;
    d.bbox = k.box;
    out.push_back(std::move(d));
  }
  return out;
}

} // namespace fw
