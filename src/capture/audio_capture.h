#pragma once

/// @file audio_capture.h
/// @brief Live capture stream feeding a rolling window of recent audio.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "capture/capture_device.h"
#include "capture/rolling_window.h"
#include "util/types.h"

namespace cadence {

/// @brief Configuration for AudioCaptureBuffer.
struct CaptureConfig {
  int sample_rate = 11025;           ///< Capture sample rate in Hz
  int operating_range_seconds = 12;  ///< Seconds of audio kept in the window
  int frame_size = 10240;            ///< Samples per device callback
  int snapshot_timeout_ms = 1000;    ///< Maximum wait for new data in snapshot()

  /// @brief Returns the window capacity in samples.
  size_t capacity() const {
    return static_cast<size_t>(sample_rate) * static_cast<size_t>(operating_range_seconds);
  }
};

/// @brief Owns a capture stream and exposes the most recent window of samples.
/// @details The device callback appends to the window and raises a "new data"
/// signal; snapshot() waits for that signal with a bounded timeout, copies the
/// window and clears the signal. The callback never blocks on the consumer.
class AudioCaptureBuffer {
 public:
  /// @brief Constructs an idle capture buffer.
  /// @param config Capture configuration
  /// @param backend Device layer (not owned, must outlive this object)
  AudioCaptureBuffer(const CaptureConfig& config, CaptureBackend& backend);

  ~AudioCaptureBuffer();

  AudioCaptureBuffer(const AudioCaptureBuffer&) = delete;
  AudioCaptureBuffer& operator=(const AudioCaptureBuffer&) = delete;

  /// @brief Opens and starts a mono 16-bit stream on a device.
  /// @param device_index Device to capture from
  /// @throws CadenceException with InvalidParameter if no device is given,
  ///         InvalidState if already running, or any backend error
  void start(std::optional<int> device_index);

  /// @brief Stops and closes the stream, then resets the backend.
  /// @details No-op when idle.
  void stop();

  /// @brief Returns a copy of the window after new data or a timeout.
  /// @details Waits up to snapshot_timeout_ms for new data. On timeout the
  ///          current (possibly stale or empty) contents are returned.
  std::vector<Sample> snapshot();

  /// @brief Lists capture-capable devices.
  /// @details Devices that fail to report are logged and skipped.
  /// @throws CadenceException with DeviceNotFound if none are available
  std::vector<DeviceInfo> enumerate_devices();

  /// @brief Returns true while a stream is open.
  bool running() const;

  /// @brief Returns the number of buffered samples.
  size_t buffered() const;

  const CaptureConfig& config() const { return config_; }

 private:
  CallbackResult on_frame(const uint8_t* data, size_t size);

  CaptureConfig config_;
  CaptureBackend& backend_;
  std::unique_ptr<CaptureStream> stream_;
  std::atomic<bool> stopping_{false};

  mutable std::mutex mutex_;
  std::condition_variable data_cv_;
  bool data_available_ = false;
  RollingAudioWindow window_;
};

}  // namespace cadence
