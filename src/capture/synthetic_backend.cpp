#include "capture/synthetic_backend.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <utility>

#include "core/pcm.h"
#include "util/exception.h"
#include "util/log.h"

namespace cadence {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

ClickTrackGenerator::ClickTrackGenerator(const ClickTrackConfig& config, int sample_rate)
    : config_(config),
      sample_rate_(sample_rate),
      period_(0.0),
      offset_(0),
      click_length_(0),
      rng_(config.seed),
      noise_dist_(-1.0f, 1.0f) {
  CADENCE_CHECK_MSG(config.bpm > 0.0 && sample_rate > 0, ErrorCode::InvalidParameter,
                    "Click track tempo and sample rate must be positive");
  period_ = 60.0 / config.bpm * sample_rate;
  offset_ = static_cast<int64_t>(std::llround(config.offset_seconds * sample_rate));
  click_length_ = std::max<int64_t>(1, std::llround(config.click_ms * 0.001 * sample_rate));
}

int64_t ClickTrackGenerator::beat_start(int64_t k) const {
  return offset_ + static_cast<int64_t>(std::llround(static_cast<double>(k) * period_));
}

float ClickTrackGenerator::render(int64_t n) {
  float value = 0.0f;
  if (n >= offset_) {
    auto k = static_cast<int64_t>(std::floor(static_cast<double>(n - offset_) / period_));
    // Rounded beat starts can land one sample either side of n.
    if (beat_start(k) > n) {
      --k;
    } else if (beat_start(k + 1) <= n) {
      ++k;
    }
    int64_t local = n - beat_start(k);
    if (k >= 0 && local < click_length_) {
      double t = static_cast<double>(local) / sample_rate_;
      double envelope = 1.0 - static_cast<double>(local) / static_cast<double>(click_length_);
      value = static_cast<float>(config_.amplitude * envelope *
                                 std::sin(2.0 * kPi * config_.tone_hz * t));
    }
  }
  if (config_.noise > 0.0f) {
    value += config_.noise * noise_dist_(rng_);
  }
  return value;
}

std::vector<Sample> ClickTrackGenerator::next(size_t count) {
  std::vector<Sample> samples(count);
  for (size_t i = 0; i < count; ++i) {
    samples[i] = float_to_pcm(render(position_++));
  }
  return samples;
}

SyntheticBackend::SyntheticBackend(std::vector<SyntheticDevice> devices)
    : devices_(std::move(devices)) {}

int SyntheticBackend::device_count() { return static_cast<int>(devices_.size()); }

DeviceInfo SyntheticBackend::device_info(int position) {
  CADENCE_CHECK_MSG(position >= 0 && position < device_count(), ErrorCode::DeviceNotFound,
                    "Invalid device position " + std::to_string(position));
  const SyntheticDevice& device = devices_[position];
  CADENCE_CHECK_MSG(!device.fail_query, ErrorCode::DeviceError,
                    "Device " + device.name + " did not respond");

  DeviceInfo info;
  info.name = device.name;
  info.index = position;
  info.max_input_channels = device.max_input_channels;
  return info;
}

std::unique_ptr<CaptureStream> SyntheticBackend::open(const StreamParams& params,
                                                      StreamCallback callback) {
  CADENCE_CHECK_MSG(params.device_index >= 0 && params.device_index < device_count(),
                    ErrorCode::DeviceNotFound,
                    "Invalid device index " + std::to_string(params.device_index));
  const SyntheticDevice& device = devices_[params.device_index];
  CADENCE_CHECK_MSG(device.max_input_channels >= params.channels, ErrorCode::DeviceError,
                    "Device " + device.name + " has no input channels");
  CADENCE_CHECK_MSG(params.bits_per_sample == 16, ErrorCode::NotImplemented,
                    "Only 16-bit capture is supported");
  CADENCE_CHECK(callback != nullptr, ErrorCode::InvalidParameter);

  ++open_count_;
  return std::make_unique<SyntheticStream>(params, device.track, std::move(callback));
}

void SyntheticBackend::reset() { ++reset_count_; }

SyntheticStream::SyntheticStream(const StreamParams& params, const ClickTrackConfig& track,
                                 StreamCallback callback)
    : params_(params),
      time_scale_(track.time_scale),
      generator_(track, params.sample_rate),
      callback_(std::move(callback)) {
  CADENCE_CHECK_MSG(params.frame_size > 0, ErrorCode::InvalidParameter,
                    "Frame size must be positive");
  CADENCE_CHECK_MSG(time_scale_ > 0.0f, ErrorCode::InvalidParameter,
                    "Time scale must be positive");
}

SyntheticStream::~SyntheticStream() { close(); }

void SyntheticStream::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  CADENCE_CHECK_MSG(!closed_, ErrorCode::InvalidState, "Stream is closed");
  if (worker_.joinable()) {
    return;
  }
  stop_requested_ = false;
  active_.store(true);
  worker_ = std::thread(&SyntheticStream::run, this);
}

void SyntheticStream::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  active_.store(false);
}

void SyntheticStream::close() {
  stop();
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
}

void SyntheticStream::run() {
  using Clock = std::chrono::steady_clock;
  const auto frame_period = std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(static_cast<double>(params_.frame_size) /
                                    params_.sample_rate / time_scale_));
  auto deadline = Clock::now();

  while (true) {
    // Frames arrive once a full frame of "recorded" audio exists.
    deadline += frame_period;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_until(lock, deadline, [this] { return stop_requested_; })) {
        break;
      }
    }

    std::vector<Sample> frame = generator_.next(static_cast<size_t>(params_.frame_size));
    std::vector<uint8_t> bytes = encode_pcm16le(frame.data(), frame.size());

    CallbackResult result;
    try {
      result = callback_(bytes.data(), bytes.size());
    } catch (const std::exception& e) {
      log::logger()->error("Synthetic stream callback failed: {}", e.what());
      result = CallbackResult::Abort;
    }
    ++frames_delivered_;
    if (result == CallbackResult::Abort) {
      log::logger()->debug("Synthetic stream aborted by callback");
      break;
    }
  }
  active_.store(false);
}

}  // namespace cadence
