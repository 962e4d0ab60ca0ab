#pragma once

/// @file tempo_band.h
/// @brief The three tempo ranges the estimator can search within.

#include <array>
#include <cstddef>
#include <string>

namespace cadence {

/// @brief Tempo band selecting which template pair is active.
enum class TempoBand {
  Band60To160,
  Band130To230,
  Band210To300,
};

/// @brief All bands in ascending order.
constexpr std::array<TempoBand, 3> kAllBands = {TempoBand::Band60To160, TempoBand::Band130To230,
                                                TempoBand::Band210To300};

/// @brief Returns the lower BPM bound of a band (its template base).
/// @param band Tempo band
/// @return 60, 130 or 210
int band_base_bpm(TempoBand band);

/// @brief Returns the position of a band in kAllBands.
size_t band_index(TempoBand band);

/// @brief Returns the range key of a band, e.g. "60–160" (en dash).
const char* band_key(TempoBand band);

/// @brief Parses a range key.
/// @details Accepts the en dash form returned by band_key() and an ASCII hyphen.
/// @param key Range key
/// @return Matching band
/// @throws CadenceException with InvalidParameter for an unknown key
TempoBand band_from_key(const std::string& key);

}  // namespace cadence
