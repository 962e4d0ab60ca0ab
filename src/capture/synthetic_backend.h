#pragma once

/// @file synthetic_backend.h
/// @brief Device layer producing synthetic click tracks.
/// @details Each device renders a click train at a fixed tempo and delivers it
/// through the regular stream callback from its own thread, paced like a real
/// device (optionally faster). Used by the tests and the simulate command.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "capture/capture_device.h"
#include "util/types.h"

namespace cadence {

/// @brief Parameters of a synthetic click train.
struct ClickTrackConfig {
  double bpm = 120.0;         ///< Tempo of the clicks
  float amplitude = 0.8f;     ///< Peak click amplitude [0, 1]
  float tone_hz = 1000.0f;    ///< Frequency of the click burst
  float click_ms = 10.0f;     ///< Click length
  float noise = 0.0f;         ///< Uniform noise amplitude [0, 1]
  double offset_seconds = 0;  ///< Time of the first click
  float time_scale = 1.0f;    ///< Delivery speed relative to real time
  uint32_t seed = 1;          ///< Noise seed
};

/// @brief Renders a click train sample by sample.
class ClickTrackGenerator {
 public:
  /// @brief Constructs a generator.
  /// @param config Click track parameters
  /// @param sample_rate Sample rate in Hz
  ClickTrackGenerator(const ClickTrackConfig& config, int sample_rate);

  /// @brief Renders the next block of samples.
  /// @param count Number of samples
  /// @return PCM samples
  std::vector<Sample> next(size_t count);

  /// @brief Returns the index of the next sample to render.
  int64_t position() const { return position_; }

  /// @brief Returns the first sample of beat k.
  int64_t beat_start(int64_t k) const;

 private:
  float render(int64_t n);

  ClickTrackConfig config_;
  int sample_rate_;
  double period_;
  int64_t offset_;
  int64_t click_length_;
  int64_t position_ = 0;
  std::mt19937 rng_;
  std::uniform_real_distribution<float> noise_dist_;
};

/// @brief A device offered by SyntheticBackend.
struct SyntheticDevice {
  std::string name;             ///< Device name
  int max_input_channels = 1;   ///< 0 makes it an output-only device
  ClickTrackConfig track;       ///< Audio rendered by the device
  bool fail_query = false;      ///< device_info() throws for this device
};

/// @brief Device layer backed by synthetic click tracks.
class SyntheticBackend : public CaptureBackend {
 public:
  explicit SyntheticBackend(std::vector<SyntheticDevice> devices);

  int device_count() override;
  DeviceInfo device_info(int position) override;
  std::unique_ptr<CaptureStream> open(const StreamParams& params,
                                      StreamCallback callback) override;
  void reset() override;

  /// @brief Returns how many times reset() was called.
  int reset_count() const { return reset_count_.load(); }

  /// @brief Returns how many streams were opened.
  int open_count() const { return open_count_.load(); }

 private:
  std::vector<SyntheticDevice> devices_;
  std::atomic<int> reset_count_{0};
  std::atomic<int> open_count_{0};
};

/// @brief Stream delivering a click track from a worker thread.
class SyntheticStream : public CaptureStream {
 public:
  SyntheticStream(const StreamParams& params, const ClickTrackConfig& track,
                  StreamCallback callback);
  ~SyntheticStream() override;

  void start() override;
  void stop() override;
  void close() override;
  bool active() const override { return active_.load(); }

  /// @brief Returns the number of frames delivered so far.
  int64_t frames_delivered() const { return frames_delivered_.load(); }

 private:
  void run();

  StreamParams params_;
  float time_scale_;
  ClickTrackGenerator generator_;
  StreamCallback callback_;

  std::thread worker_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  bool closed_ = false;
  std::atomic<bool> active_{false};
  std::atomic<int64_t> frames_delivered_{0};
};

}  // namespace cadence
