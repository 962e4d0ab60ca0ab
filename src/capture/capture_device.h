#pragma once

/// @file capture_device.h
/// @brief Device layer used by the capture buffer.
/// @details A backend enumerates input devices and opens callback-driven PCM
/// streams on them. Platform backends live outside the library; the library
/// ships SyntheticBackend for tests and simulation.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cadence {

/// @brief Description of an audio device.
struct DeviceInfo {
  std::string name;            ///< Human-readable name
  int index = -1;              ///< Index to pass to open()
  int max_input_channels = 0;  ///< 0 for output-only devices
};

/// @brief Parameters of a capture stream.
struct StreamParams {
  int sample_rate = 11025;   ///< Sample rate in Hz
  int channels = 1;          ///< Channel count
  int bits_per_sample = 16;  ///< Sample width
  int frame_size = 10240;    ///< Samples delivered per callback
  int device_index = -1;     ///< Device to open
};

/// @brief Return value of a stream callback.
enum class CallbackResult {
  Continue,  ///< Keep delivering frames
  Abort,     ///< Stop the stream immediately
};

/// @brief Stream callback receiving little-endian 16-bit PCM bytes.
/// @details Invoked on the backend's audio thread.
using StreamCallback = std::function<CallbackResult(const uint8_t* data, size_t size)>;

/// @brief An open capture stream.
class CaptureStream {
 public:
  virtual ~CaptureStream() = default;

  /// @brief Starts delivering frames to the callback.
  virtual void start() = 0;

  /// @brief Stops delivering frames. Blocks until no callback is running.
  virtual void stop() = 0;

  /// @brief Releases the stream. The stream cannot be restarted afterwards.
  virtual void close() = 0;

  /// @brief Returns true while frames are being delivered.
  virtual bool active() const = 0;
};

/// @brief Audio host interface.
class CaptureBackend {
 public:
  virtual ~CaptureBackend() = default;

  /// @brief Returns the number of devices known to the host.
  virtual int device_count() = 0;

  /// @brief Returns information about the device at a position.
  /// @throws CadenceException if the device cannot be queried
  virtual DeviceInfo device_info(int position) = 0;

  /// @brief Opens a stream. The stream is created stopped.
  /// @throws CadenceException if the device cannot be opened
  virtual std::unique_ptr<CaptureStream> open(const StreamParams& params,
                                              StreamCallback callback) = 0;

  /// @brief Releases and reinitializes the host context.
  virtual void reset() = 0;
};

}  // namespace cadence
