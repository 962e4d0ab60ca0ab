#include "filters/prefilter.h"

#include "core/pcm.h"

namespace cadence {

BandpassPrefilter::BandpassPrefilter(const FilterConfig& config, int sample_rate)
    : cascade_(butterworth_bandpass(config.order, config.low_hz, config.high_hz, sample_rate)) {}

std::vector<float> BandpassPrefilter::process(const Sample* samples, size_t size) const {
  if (size == 0) {
    return {};
  }
  std::vector<float> input = pcm_to_float(samples, size);
  return apply_cascade(input.data(), input.size(), cascade_);
}

}  // namespace cadence
