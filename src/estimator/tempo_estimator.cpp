#include "estimator/tempo_estimator.h"

#include <exception>
#include <utility>

#include "analysis/beat_events.h"
#include "util/exception.h"
#include "util/log.h"

namespace cadence {

namespace {

const EstimatorConfig& validated(const EstimatorConfig& config) {
  config.validate();
  return config;
}

}  // namespace

TempoEstimator::TempoEstimator(const EstimatorConfig& config, AudioCaptureBuffer& capture,
                               TemplateLibrary templates, UiSink& ui, SyncPeer& sync)
    : config_(validated(config)),
      capture_(capture),
      templates_(std::move(templates)),
      ui_(ui),
      sync_(sync),
      prefilter_(config.filter, config.capture.sample_rate),
      active_(templates_.get(config.initial_band)),
      history_(config.average_window) {
  CADENCE_CHECK_MSG(capture.config().sample_rate == config.capture.sample_rate,
                    ErrorCode::InvalidParameter,
                    "Capture buffer sample rate differs from the estimator configuration");
}

TempoEstimator::~TempoEstimator() {
  try {
    stop();
  } catch (const std::exception& e) {
    log::logger()->error("Error stopping analyzer during shutdown: {}", e.what());
  }
}

void TempoEstimator::start(std::optional<int> device_index) {
  CADENCE_CHECK_MSG(!running_.load(), ErrorCode::InvalidState, "BPM analyzer already running");

  try {
    // A loop that ended on an error leaves its thread and the stream behind.
    if (thread_.joinable()) {
      thread_.join();
    }
    capture_.stop();

    stop_flag_.store(false);
    capture_.start(device_index);
    sync_.enable(true);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_.clear();
    }
    running_.store(true);
    thread_ = std::thread(&TempoEstimator::run, this);
    log::logger()->info("BPM analyzer thread started with device index {}", *device_index);
  } catch (const std::exception& e) {
    log::logger()->error("Error starting analyzer: {}", e.what());
    throw;
  }
}

void TempoEstimator::stop() {
  stop_flag_.store(true);
  try {
    capture_.stop();
  } catch (const std::exception& e) {
    log::logger()->error("Error stopping analyzer: {}", e.what());
  }

  bool was_running = thread_.joinable();
  if (was_running) {
    sync_.enable(false);
    // The loop leaves after at most one snapshot timeout plus one search.
    thread_.join();
    log::logger()->info("BPM analyzer thread stopped");
  }
}

void TempoEstimator::select_band(const std::string& range_key) {
  select_band(band_from_key(range_key));
}

void TempoEstimator::select_band(TempoBand band) {
  auto templates = templates_.get(band);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    active_ = std::move(templates);
  }
  log::logger()->info("Tempo range set to {}", band_key(band));
}

TempoBand TempoEstimator::band() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_->band;
}

std::vector<DeviceInfo> TempoEstimator::enumerate_devices() {
  return capture_.enumerate_devices();
}

BpmEstimate TempoEstimator::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

EstimatorState TempoEstimator::state() const {
  return running_.load() ? EstimatorState::Running : EstimatorState::Idle;
}

std::string TempoEstimator::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::optional<BpmEstimate> TempoEstimator::analyze(const std::vector<Sample>& samples) {
  std::vector<float> filtered = prefilter_.process(samples);
  std::vector<int> events = extract_beat_events(filtered, config_.capture.sample_rate);

  BpmEstimate published;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto result = search_.search(events, *active_);
    if (!result) {
      log::logger()->debug("No confident tempo in {} events", events.size());
      return std::nullopt;
    }
    double average = history_.push(result->bpm);
    current_ = BpmEstimate::from_value(average);
    published = current_;
    log::logger()->debug("Raw BPM {:.2f} (coarse votes {}, fine votes {})", result->bpm,
                         result->coarse_votes, result->fine_votes);
  }

  log::logger()->info("Detected BPM: {}", published.text);
  ui_.set_bpm(published.bpm);
  sync_.set_bpm(published.bpm);
  return published;
}

void TempoEstimator::run() {
  while (!stop_flag_.load()) {
    try {
      std::vector<Sample> samples = capture_.snapshot();
      analyze(samples);
    } catch (const std::exception& e) {
      log::logger()->error("Error in analysis loop: {}", e.what());
      std::lock_guard<std::mutex> lock(mutex_);
      last_error_ = e.what();
      break;
    }
  }
  running_.store(false);
}

}  // namespace cadence
