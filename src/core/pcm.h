#pragma once

/// @file pcm.h
/// @brief 16-bit PCM decoding and conversion.

#include <cstddef>
#include <cstdint>
#include <vector>

#include "util/types.h"

namespace cadence {

/// @brief Decodes little-endian signed 16-bit PCM bytes into samples.
/// @param bytes Raw PCM data
/// @param size Number of bytes (a trailing odd byte is ignored)
/// @return Decoded samples
std::vector<Sample> decode_pcm16le(const uint8_t* bytes, size_t size);

/// @brief Encodes samples as little-endian signed 16-bit PCM bytes.
/// @param samples Input samples
/// @param size Number of samples
/// @return Raw PCM data (2 bytes per sample)
std::vector<uint8_t> encode_pcm16le(const Sample* samples, size_t size);

/// @brief Converts PCM samples to float in [-1, 1).
/// @param samples Input samples
/// @param size Number of samples
/// @return Float samples
std::vector<float> pcm_to_float(const Sample* samples, size_t size);

/// @brief Converts a float in [-1, 1] to a saturated PCM sample.
Sample float_to_pcm(float value);

}  // namespace cadence
