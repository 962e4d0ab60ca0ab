#include "capture/audio_capture.h"

#include <exception>
#include <string>
#include <utility>

#include "core/pcm.h"
#include "util/exception.h"
#include "util/log.h"

namespace cadence {

AudioCaptureBuffer::AudioCaptureBuffer(const CaptureConfig& config, CaptureBackend& backend)
    : config_(config), backend_(backend), window_(config.capacity()) {
  CADENCE_CHECK_MSG(config.sample_rate > 0 && config.frame_size > 0, ErrorCode::InvalidParameter,
                    "Capture sample rate and frame size must be positive");
  CADENCE_CHECK_MSG(config.snapshot_timeout_ms > 0, ErrorCode::InvalidParameter,
                    "Snapshot timeout must be positive");
}

AudioCaptureBuffer::~AudioCaptureBuffer() {
  try {
    stop();
  } catch (const std::exception& e) {
    log::logger()->error("Error stopping capture during shutdown: {}", e.what());
  }
}

void AudioCaptureBuffer::start(std::optional<int> device_index) {
  try {
    CADENCE_CHECK_MSG(device_index.has_value(), ErrorCode::InvalidParameter,
                      "No audio device selected");
    CADENCE_CHECK_MSG(stream_ == nullptr, ErrorCode::InvalidState,
                      "Audio stream already running");

    stopping_.store(false);

    StreamParams params;
    params.sample_rate = config_.sample_rate;
    params.channels = 1;
    params.bits_per_sample = 16;
    params.frame_size = config_.frame_size;
    params.device_index = *device_index;

    auto stream = backend_.open(
        params, [this](const uint8_t* data, size_t size) { return on_frame(data, size); });
    CADENCE_CHECK_MSG(stream != nullptr, ErrorCode::DeviceError, "Backend returned no stream");
    stream->start();
    stream_ = std::move(stream);

    log::logger()->info("Audio stream started with device {}", *device_index);
  } catch (const std::exception& e) {
    log::logger()->error("Error starting stream: {}", e.what());
    throw;
  }
}

void AudioCaptureBuffer::stop() {
  stopping_.store(true);
  if (!stream_) {
    return;
  }

  try {
    stream_->stop();
    stream_->close();
    stream_.reset();
    backend_.reset();
    log::logger()->info("Audio stream stopped");
  } catch (const std::exception& e) {
    stream_.reset();
    log::logger()->error("Error stopping stream: {}", e.what());
    throw;
  }
}

std::vector<Sample> AudioCaptureBuffer::snapshot() {
  std::unique_lock<std::mutex> lock(mutex_);
  data_cv_.wait_for(lock, std::chrono::milliseconds(config_.snapshot_timeout_ms),
                    [this] { return data_available_; });
  std::vector<Sample> samples = window_.to_vector();
  data_available_ = false;
  return samples;
}

std::vector<DeviceInfo> AudioCaptureBuffer::enumerate_devices() {
  int count = backend_.device_count();
  CADENCE_CHECK_MSG(count > 0, ErrorCode::DeviceNotFound, "No audio device found on system");

  std::vector<DeviceInfo> devices;
  for (int i = 0; i < count; ++i) {
    try {
      DeviceInfo info = backend_.device_info(i);
      if (info.max_input_channels > 0) {
        devices.push_back(std::move(info));
      }
    } catch (const std::exception& e) {
      log::logger()->warn("Error enumerating device {}: {}", i, e.what());
    }
  }

  CADENCE_CHECK_MSG(!devices.empty(), ErrorCode::DeviceNotFound, "No audio input device found");
  log::logger()->info("{} audio device(s) found", devices.size());
  return devices;
}

bool AudioCaptureBuffer::running() const { return stream_ != nullptr; }

size_t AudioCaptureBuffer::buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return window_.size();
}

CallbackResult AudioCaptureBuffer::on_frame(const uint8_t* data, size_t size) {
  if (stopping_.load()) {
    return CallbackResult::Abort;
  }

  try {
    std::vector<Sample> samples = decode_pcm16le(data, size);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      window_.append(samples);
      data_available_ = true;
    }
    data_cv_.notify_one();
    return CallbackResult::Continue;
  } catch (const std::exception& e) {
    log::logger()->error("Error in audio callback: {}", e.what());
    return CallbackResult::Abort;
  }
}

}  // namespace cadence
