#include "core/pcm.h"

#include <cmath>
#include <limits>

namespace cadence {

namespace {
constexpr float kPcmScale = 32768.0f;
}

std::vector<Sample> decode_pcm16le(const uint8_t* bytes, size_t size) {
  size_t count = size / 2;
  std::vector<Sample> samples(count);
  if (count == 0) {
    return samples;
  }

  for (size_t i = 0; i < count; ++i) {
    uint16_t lo = bytes[i * 2];
    uint16_t hi = bytes[i * 2 + 1];
    samples[i] = static_cast<Sample>(static_cast<uint16_t>(lo | (hi << 8)));
  }
  return samples;
}

std::vector<uint8_t> encode_pcm16le(const Sample* samples, size_t size) {
  std::vector<uint8_t> bytes(size * 2);
  for (size_t i = 0; i < size; ++i) {
    uint16_t v = static_cast<uint16_t>(samples[i]);
    bytes[i * 2] = static_cast<uint8_t>(v & 0xFF);
    bytes[i * 2 + 1] = static_cast<uint8_t>(v >> 8);
  }
  return bytes;
}

std::vector<float> pcm_to_float(const Sample* samples, size_t size) {
  std::vector<float> out(size);
  for (size_t i = 0; i < size; ++i) {
    out[i] = static_cast<float>(samples[i]) / kPcmScale;
  }
  return out;
}

Sample float_to_pcm(float value) {
  float scaled = std::round(value * kPcmScale);
  if (scaled > std::numeric_limits<Sample>::max()) {
    return std::numeric_limits<Sample>::max();
  }
  if (scaled < std::numeric_limits<Sample>::min()) {
    return std::numeric_limits<Sample>::min();
  }
  return static_cast<Sample>(scaled);
}

}  // namespace cadence
