#include "detection/replay_source.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fw {

static std::runtime_error ScriptError(std::size_t frame_index, const std::string& msg) {
  std::ostringstream oss;
  oss << "Replay script error at frames[" << frame_index << "]: " << msg;
  return std::runtime_error(oss.str());
}

static Detection ParseDetection(const YAML::Node& n, std::size_t frame_index) {
  if (!n.IsMap()) throw ScriptError(frame_index, "detection entries must be maps");

  Detection d;
  try {
    d.label = n["label"].as<std::string>("bird");
    d.confidence = n["confidence"].as<float>(1.f);
    d.bbox.x = n["x"].as<float>(0.f);
    d.bbox.y = n["y"].as<float>(0.f);
    d.bbox.w = n["width"].as<float>(0.f);
    d.bbox.h = n["height"].as<float>(0.f);
  } catch (const YAML::Exception& e) {
    throw ScriptError(frame_index, e.what());
  }
  return d;
}

// Placeholder detection used by the "count: N" shorthand
static Detection GenericBird(int i) {
  Detection d;
  d.label = "bird";
  d.confidence = 0.9f;
  d.bbox = BBox{0.1f + 0.2f * static_cast<float>(i % 4), 0.4f, 0.1f, 0.1f};
  return d;
}

static ReplaySource FromRoot(const YAML::Node& root) {
  if (!root || !root.IsMap()) throw std::runtime_error("Replay script must be a map with a 'frames' list");

  double start_time = 0.0;
  try {
    if (root["start_time"]) start_time = root["start_time"].as<double>();
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Replay script error at 'start_time': ") + e.what());
  }

  const YAML::Node frames = root["frames"];
  if (!frames || !frames.IsSequence()) throw std::runtime_error("Replay script needs a 'frames' list");

  std::vector<DetectionFrame> out;
  out.reserve(frames.size());

  for (std::size_t i = 0; i < frames.size(); ++i) {
    const YAML::Node f = frames[i];
    if (!f.IsMap() || !f["t"]) throw ScriptError(i, "each frame needs a 't' timestamp");

    DetectionFrame df;
    df.sequence_id = i;
    try {
      df.timestamp = start_time + f["t"].as<double>();
    } catch (const YAML::Exception& e) {
      throw ScriptError(i, e.what());
    }
    if (!std::isfinite(df.timestamp)) throw ScriptError(i, "'t' must be a finite number");

    const YAML::Node dets = f["detections"];
    if (dets) {
      if (!dets.IsSequence()) throw ScriptError(i, "'detections' must be a list");
      for (const auto& dn : dets) df.items.push_back(ParseDetection(dn, i));
    }

    const YAML::Node count = f["count"];
    if (count) {
      int n = 0;
      try {
        n = count.as<int>();
      } catch (const YAML::Exception& e) {
        throw ScriptError(i, e.what());
      }
      if (n < 0) throw ScriptError(i, "'count' must be >= 0");
      for (int k = 0; k < n; ++k) df.items.push_back(GenericBird(k));
    }

    out.push_back(std::move(df));
  }

  return ReplaySource(std::move(out));
}

ReplaySource ReplaySource::FromYamlFile(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load replay script '") + path + "': " + e.what());
  }
  return FromRoot(root);
}

ReplaySource ReplaySource::FromYamlString(const std::string& yaml) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse replay script: ") + e.what());
  }
  return FromRoot(root);
}

ReplaySource::ReplaySource(std::vector<DetectionFrame> frames) : frames_(std::move(frames)) {}

bool ReplaySource::next(DetectionFrame& out) {
  if (pos_ >= frames_.size()) return false;
  out = frames_[pos_++];
  return true;
}

} // namespace fw
