/// @file synthetic_backend_test.cpp
/// @brief Tests for the synthetic device layer.

#include "capture/synthetic_backend.h"

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <vector>

#include "core/pcm.h"
#include "util/exception.h"
#include "util/test_fixtures.h"

using namespace cadence;
using namespace std::chrono_literals;
using cadence::test::kSampleRate;
using cadence::test::wait_until;

TEST_CASE("ClickTrackGenerator places clicks on rounded beats", "[synthetic]") {
  ClickTrackConfig config;
  config.bpm = 120.0;
  ClickTrackGenerator generator(config, kSampleRate);

  REQUIRE(generator.beat_start(0) == 0);
  REQUIRE(generator.beat_start(1) == 5513);
  REQUIRE(generator.beat_start(2) == 11025);

  auto samples = generator.next(11025 + 200);
  REQUIRE(generator.position() == 11225);

  // Clicks are 10 ms bursts, silence elsewhere.
  REQUIRE(samples[5513] == 0);
  REQUIRE(samples[5516] != 0);
  REQUIRE(samples[3000] == 0);
  REQUIRE(samples[5513 + 200] == 0);
  REQUIRE(samples[11028] != 0);
}

TEST_CASE("ClickTrackGenerator is continuous across blocks", "[synthetic]") {
  ClickTrackConfig config;
  config.bpm = 97.3;
  config.noise = 0.05f;
  ClickTrackGenerator whole(config, kSampleRate);
  ClickTrackGenerator split(config, kSampleRate);

  auto expected = whole.next(30000);
  std::vector<Sample> actual;
  for (size_t block : {7000u, 13u, 10240u, 12747u}) {
    auto part = split.next(block);
    actual.insert(actual.end(), part.begin(), part.end());
  }
  REQUIRE(actual == expected);
}

TEST_CASE("ClickTrackGenerator offset", "[synthetic]") {
  ClickTrackConfig config;
  config.offset_seconds = 0.5;
  ClickTrackGenerator generator(config, kSampleRate);

  auto samples = generator.next(6000);
  for (size_t i = 0; i < 5513; ++i) {
    REQUIRE(samples[i] == 0);
  }
  REQUIRE(generator.beat_start(0) == 5513);
}

TEST_CASE("ClickTrackGenerator rejects invalid tempo", "[synthetic]") {
  ClickTrackConfig config;
  config.bpm = 0.0;
  REQUIRE_THROWS_AS(ClickTrackGenerator(config, kSampleRate), CadenceException);
}

TEST_CASE("SyntheticBackend device queries", "[synthetic]") {
  SyntheticDevice output;
  output.name = "out";
  output.max_input_channels = 0;
  SyntheticDevice broken;
  broken.name = "broken";
  broken.fail_query = true;

  SyntheticBackend backend({output, broken});
  REQUIRE(backend.device_count() == 2);
  REQUIRE(backend.device_info(0).max_input_channels == 0);
  REQUIRE_THROWS_AS(backend.device_info(1), CadenceException);
  REQUIRE_THROWS_AS(backend.device_info(2), CadenceException);

  StreamParams params;
  params.device_index = 0;
  REQUIRE_THROWS_AS(backend.open(params, [](const uint8_t*, size_t) {
                      return CallbackResult::Continue;
                    }),
                    CadenceException);
}

TEST_CASE("SyntheticStream delivers PCM frames", "[synthetic]") {
  SyntheticDevice device;
  device.name = "click";
  device.track.time_scale = 50.0f;
  SyntheticBackend backend({device});

  std::atomic<int> frames{0};
  std::atomic<size_t> bytes_seen{0};
  StreamParams params;
  params.device_index = 0;
  params.frame_size = 1024;

  auto stream = backend.open(params, [&](const uint8_t*, size_t size) {
    bytes_seen += size;
    ++frames;
    return CallbackResult::Continue;
  });
  REQUIRE(backend.open_count() == 1);
  REQUIRE_FALSE(stream->active());

  stream->start();
  REQUIRE(wait_until([&] { return frames.load() >= 3; }, 5000ms));
  stream->stop();
  REQUIRE_FALSE(stream->active());

  int after_stop = frames.load();
  std::this_thread::sleep_for(50ms);
  REQUIRE(frames.load() == after_stop);
  REQUIRE(bytes_seen.load() == static_cast<size_t>(after_stop) * 2048);

  stream->close();
  REQUIRE_THROWS_AS(stream->start(), CadenceException);
}

TEST_CASE("SyntheticStream stops when the callback aborts", "[synthetic]") {
  SyntheticDevice device;
  device.name = "click";
  device.track.time_scale = 50.0f;
  SyntheticBackend backend({device});

  std::atomic<int> frames{0};
  StreamParams params;
  params.device_index = 0;
  params.frame_size = 512;

  auto stream = backend.open(params, [&](const uint8_t*, size_t) {
    return ++frames >= 2 ? CallbackResult::Abort : CallbackResult::Continue;
  });
  stream->start();

  REQUIRE(wait_until([&] { return !stream->active(); }, 5000ms));
  REQUIRE(frames.load() == 2);
  stream->close();
}
