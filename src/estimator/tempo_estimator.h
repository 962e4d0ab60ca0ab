#pragma once

/// @file tempo_estimator.h
/// @brief Live tempo estimation loop.

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "analysis/tempo_search.h"
#include "capture/audio_capture.h"
#include "estimator/bpm_history.h"
#include "estimator/estimator_config.h"
#include "estimator/sinks.h"
#include "filters/prefilter.h"
#include "pattern/pattern_factory.h"

namespace cadence {

/// @brief Lifecycle state of the estimator.
enum class EstimatorState {
  Idle,
  Running,
};

/// @brief Runs the analysis thread and publishes tempo estimates.
/// @details Each iteration snapshots the capture window, band-pass filters it,
/// extracts beat events and runs the voting search against the active band.
/// Confident results are smoothed over the last average_window estimates and
/// forwarded to the UI sink and the sync peer.
///
/// The active templates, the search accumulators, the history and the
/// published estimate share one mutex. A band switch therefore waits for an
/// in-flight search, which completes with the templates it started with.
///
/// Usage:
/// @code
///   MemoryTemplateStore store;
///   PatternFactory factory(config.pattern, store);
///   AudioCaptureBuffer capture(config.capture, backend);
///   TempoEstimator estimator(config, capture, factory.load_all(), display, link);
///   estimator.start(device_index);
///   ...
///   estimator.select_band("130–230");
///   BpmEstimate now = estimator.current();
///   estimator.stop();
/// @endcode
class TempoEstimator {
 public:
  /// @brief Constructs an idle estimator.
  /// @param config Estimator configuration
  /// @param capture Capture buffer (not owned)
  /// @param templates Loaded templates; must contain config.initial_band
  /// @param ui Display sink (not owned)
  /// @param sync Tempo-sync peer (not owned)
  /// @throws CadenceException on invalid configuration or missing templates
  TempoEstimator(const EstimatorConfig& config, AudioCaptureBuffer& capture,
                 TemplateLibrary templates, UiSink& ui, SyncPeer& sync);

  ~TempoEstimator();

  TempoEstimator(const TempoEstimator&) = delete;
  TempoEstimator& operator=(const TempoEstimator&) = delete;

  /// @brief Starts capture on a device and launches the analysis thread.
  /// @throws CadenceException if already running or capture fails to start
  void start(std::optional<int> device_index);

  /// @brief Stops capture, disables sync and waits for the analysis thread.
  void stop();

  /// @brief Switches the active tempo band by range key (e.g. "130–230").
  /// @throws CadenceException for unknown keys or bands without templates
  void select_band(const std::string& range_key);

  /// @brief Switches the active tempo band.
  void select_band(TempoBand band);

  /// @brief Returns the active tempo band.
  TempoBand band() const;

  /// @brief Lists capture devices.
  std::vector<DeviceInfo> enumerate_devices();

  /// @brief Returns the latest published estimate.
  BpmEstimate current() const;

  /// @brief Returns Running while the analysis thread is alive.
  EstimatorState state() const;

  /// @brief Returns the error that ended the last run (empty if none).
  std::string last_error() const;

  /// @brief Runs one analysis iteration on a window of samples.
  /// @details Filters, searches and, on a confident result, publishes.
  /// @return The published (smoothed) estimate, or std::nullopt if the
  ///         search was not confident
  std::optional<BpmEstimate> analyze(const std::vector<Sample>& samples);

 private:
  void run();

  EstimatorConfig config_;
  AudioCaptureBuffer& capture_;
  TemplateLibrary templates_;
  UiSink& ui_;
  SyncPeer& sync_;
  BandpassPrefilter prefilter_;

  mutable std::mutex mutex_;
  std::shared_ptr<const BandTemplates> active_;
  TempoVotingSearch search_;
  BpmHistory history_;
  BpmEstimate current_;
  std::string last_error_;

  std::thread thread_;
  std::atomic<bool> stop_flag_{false};
  std::atomic<bool> running_{false};
};

}  // namespace cadence
