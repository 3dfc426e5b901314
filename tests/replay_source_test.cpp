#include <iostream>
#include <stdexcept>
#include <string>

#include "detection/replay_source.hpp"
#include "test_check.hpp"

static void ParsesFramesAndShorthand() {
  fw::ReplaySource src = fw::ReplaySource::FromYamlString(R"(
start_time: 1000
frames:
  - t: 0
    detections: []
  - t: 1.5
    detections:
      - {label: bird, confidence: 0.82, x: 0.41, y: 0.30, width: 0.12, height: 0.10}
      - {label: cat, confidence: 0.6, x: 0.1, y: 0.1, width: 0.3, height: 0.3}
  - t: 2
    count: 3
  - t: 3
)");

  FW_CHECK_EQ(src.size(), 4u);

  fw::DetectionFrame f;
  FW_CHECK(src.next(f));
  FW_CHECK_NEAR(f.timestamp, 1000.0, 1e-9);
  FW_CHECK(f.items.empty());
  FW_CHECK_EQ(f.sequence_id, 0u);

  FW_CHECK(src.next(f));
  FW_CHECK_NEAR(f.timestamp, 1001.5, 1e-9);
  FW_CHECK_EQ(f.items.size(), 2u);
  if (f.items.size() == 2) {
    FW_CHECK_EQ(f.items[0].label, std::string("bird"));
    FW_CHECK_NEAR(f.items[0].confidence, 0.82f, 1e-6);
    FW_CHECK_NEAR(f.items[0].bbox.x, 0.41f, 1e-6);
    FW_CHECK_NEAR(f.items[0].bbox.h, 0.10f, 1e-6);
    FW_CHECK_EQ(f.items[1].label, std::string("cat"));
  }

  FW_CHECK(src.next(f));
  FW_CHECK_EQ(f.items.size(), 3u);
  for (const auto& d : f.items) FW_CHECK_EQ(d.label, std::string("bird"));

  FW_CHECK(src.next(f));
  FW_CHECK(f.items.empty());
  FW_CHECK_EQ(src.remaining(), 0u);
  FW_CHECK(!src.next(f));
}

static void MissingFieldsTakeDefaults() {
  fw::ReplaySource src = fw::ReplaySource::FromYamlString("frames:\n  - t: 4\n    detections:\n      - {x: 0.2}\n");
  fw::DetectionFrame f;
  FW_CHECK(src.next(f));
  FW_CHECK_NEAR(f.timestamp, 4.0, 1e-9);
  FW_CHECK_EQ(f.items.size(), 1u);
  if (!f.items.empty()) {
    FW_CHECK_EQ(f.items[0].label, std::string("bird"));
    FW_CHECK_NEAR(f.items[0].confidence, 1.0f, 1e-6);
  }
}

static void RejectsMalformedScripts() {
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("frames: 3\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("- 1\n- 2\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("frames:\n  - detections: []\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("frames:\n  - t: soon\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("frames:\n  - t: .nan\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("frames:\n  - t: .inf\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("frames:\n  - t: 1\n    count: -2\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlString("frames:\n  - t: 1\n    detections: [1, 2]\n"));
  FW_CHECK_THROWS(fw::ReplaySource::FromYamlFile("does/not/exist.yaml"));

  try {
    fw::ReplaySource::FromYamlString("frames:\n  - t: 0\n  - t: 1\n    count: x\n");
    FW_CHECK(false);
  } catch (const std::runtime_error& e) {
    FW_CHECK(std::string(e.what()).find("frames[1]") != std::string::npos);
  }
}

int main() {
  ParsesFramesAndShorthand();
  MissingFieldsTakeDefaults();
  RejectsMalformedScripts();
  return fw_test::TestExitCode();
}
