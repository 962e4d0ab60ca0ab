/// @file audio_capture_test.cpp
/// @brief Tests for the capture buffer.

#include "capture/audio_capture.h"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "util/exception.h"
#include "util/test_fixtures.h"

using namespace cadence;
using namespace std::chrono_literals;
using cadence::test::wait_until;

namespace {

SyntheticDevice input_device(const std::string& name, float time_scale = 20.0f) {
  SyntheticDevice device;
  device.name = name;
  device.track.time_scale = time_scale;
  return device;
}

SyntheticDevice output_device(const std::string& name) {
  SyntheticDevice device;
  device.name = name;
  device.max_input_channels = 0;
  return device;
}

CaptureConfig small_capture() {
  CaptureConfig config;
  config.operating_range_seconds = 2;
  config.frame_size = 2048;
  config.snapshot_timeout_ms = 200;
  return config;
}

/// Backend whose driver fails with a foreign exception on one device.
class ForeignErrorBackend : public SyntheticBackend {
 public:
  ForeignErrorBackend(std::vector<SyntheticDevice> devices, int failing)
      : SyntheticBackend(std::move(devices)), failing_(failing) {}

  DeviceInfo device_info(int position) override {
    if (position == failing_) {
      throw std::runtime_error("driver query failed");
    }
    return SyntheticBackend::device_info(position);
  }

 private:
  int failing_;
};

ErrorCode error_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const CadenceException& e) {
    return e.code();
  }
  return ErrorCode::Ok;
}

}  // namespace

TEST_CASE("CaptureConfig capacity", "[audio_capture]") {
  CaptureConfig config;
  REQUIRE(config.capacity() == 132300);
}

TEST_CASE("enumerate_devices lists input devices only", "[audio_capture]") {
  SyntheticBackend backend(
      {output_device("speakers"), input_device("mic"), input_device("line in")});
  AudioCaptureBuffer capture(CaptureConfig{}, backend);

  auto devices = capture.enumerate_devices();
  REQUIRE(devices.size() == 2);
  REQUIRE(devices[0].name == "mic");
  REQUIRE(devices[0].index == 1);
  REQUIRE(devices[1].name == "line in");
  REQUIRE(devices[1].index == 2);
}

TEST_CASE("enumerate_devices skips devices that fail to answer", "[audio_capture]") {
  auto broken = input_device("broken");
  broken.fail_query = true;
  SyntheticBackend backend({broken, input_device("mic")});
  AudioCaptureBuffer capture(CaptureConfig{}, backend);

  auto devices = capture.enumerate_devices();
  REQUIRE(devices.size() == 1);
  REQUIRE(devices[0].index == 1);
}

TEST_CASE("enumerate_devices skips devices failing with any exception", "[audio_capture]") {
  ForeignErrorBackend backend({input_device("mic"), input_device("usb"), input_device("line in")},
                              1);
  AudioCaptureBuffer capture(CaptureConfig{}, backend);

  auto devices = capture.enumerate_devices();
  REQUIRE(devices.size() == 2);
  REQUIRE(devices[0].name == "mic");
  REQUIRE(devices[1].name == "line in");
}

TEST_CASE("enumerate_devices errors", "[audio_capture]") {
  SECTION("no devices") {
    SyntheticBackend backend(std::vector<SyntheticDevice>{});
    AudioCaptureBuffer capture(CaptureConfig{}, backend);
    REQUIRE(error_of([&] { capture.enumerate_devices(); }) == ErrorCode::DeviceNotFound);
  }

  SECTION("no input devices") {
    SyntheticBackend backend({output_device("speakers")});
    AudioCaptureBuffer capture(CaptureConfig{}, backend);
    try {
      capture.enumerate_devices();
      FAIL("expected CadenceException");
    } catch (const CadenceException& e) {
      REQUIRE(e.code() == ErrorCode::DeviceNotFound);
      REQUIRE(std::string(e.what()).find("No audio input device found") != std::string::npos);
    }
  }
}

TEST_CASE("start requires a device", "[audio_capture]") {
  SyntheticBackend backend({input_device("mic")});
  AudioCaptureBuffer capture(small_capture(), backend);

  REQUIRE(error_of([&] { capture.start(std::nullopt); }) == ErrorCode::InvalidParameter);
  REQUIRE_FALSE(capture.running());
  REQUIRE(backend.open_count() == 0);
}

TEST_CASE("start fails on output-only device", "[audio_capture]") {
  SyntheticBackend backend({output_device("speakers")});
  AudioCaptureBuffer capture(small_capture(), backend);

  REQUIRE(error_of([&] { capture.start(0); }) == ErrorCode::DeviceError);
  REQUIRE_FALSE(capture.running());
}

TEST_CASE("capture fills the rolling window", "[audio_capture]") {
  SyntheticBackend backend({input_device("mic")});
  CaptureConfig config = small_capture();
  AudioCaptureBuffer capture(config, backend);

  capture.start(0);
  REQUIRE(capture.running());
  REQUIRE(error_of([&] { capture.start(0); }) == ErrorCode::InvalidState);

  auto first = capture.snapshot();
  REQUIRE_FALSE(first.empty());
  REQUIRE(first.size() <= config.capacity());

  REQUIRE(wait_until([&] { return capture.buffered() == config.capacity(); }, 10000ms));
  auto full = capture.snapshot();
  REQUIRE(full.size() == config.capacity());

  capture.stop();
  REQUIRE_FALSE(capture.running());
  REQUIRE(backend.reset_count() == 1);
}

TEST_CASE("snapshot returns after timeout without new data", "[audio_capture]") {
  SyntheticBackend backend({input_device("mic")});
  AudioCaptureBuffer capture(small_capture(), backend);

  auto begin = std::chrono::steady_clock::now();
  auto samples = capture.snapshot();
  auto elapsed = std::chrono::steady_clock::now() - begin;

  REQUIRE(samples.empty());
  REQUIRE(elapsed >= 150ms);
}

TEST_CASE("stop is a no-op when idle", "[audio_capture]") {
  SyntheticBackend backend({input_device("mic")});
  AudioCaptureBuffer capture(small_capture(), backend);

  capture.stop();
  capture.stop();
  REQUIRE(backend.reset_count() == 0);
}

TEST_CASE("capture restarts after stop", "[audio_capture]") {
  SyntheticBackend backend({input_device("mic")});
  AudioCaptureBuffer capture(small_capture(), backend);

  capture.start(0);
  capture.stop();
  capture.start(0);
  REQUIRE(capture.running());
  REQUIRE_FALSE(capture.snapshot().empty());
  capture.stop();

  REQUIRE(backend.open_count() == 2);
  REQUIRE(backend.reset_count() == 2);
}
