#pragma once

/// @file sinks.h
/// @brief Consumers of published tempo estimates.

namespace cadence {

/// @brief Display receiving the published tempo.
/// @details Called from the analysis thread; implementations must not block.
class UiSink {
 public:
  virtual ~UiSink() = default;

  /// @brief Shows a new tempo.
  virtual void set_bpm(float bpm) = 0;
};

/// @brief Tempo-sync protocol peer.
class SyncPeer {
 public:
  virtual ~SyncPeer() = default;

  /// @brief Joins or leaves the sync session.
  virtual void enable(bool enabled) = 0;

  /// @brief Proposes a new session tempo.
  virtual void set_bpm(float bpm) = 0;
};

}  // namespace cadence
