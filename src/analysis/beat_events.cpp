#include "analysis/beat_events.h"

#include <algorithm>

#include "util/exception.h"
#include "util/math_utils.h"

namespace cadence {

std::vector<int> extract_beat_events(const float* samples, size_t size, int sample_rate) {
  CADENCE_CHECK(sample_rate >= 2, ErrorCode::InvalidParameter);
  if (size == 0) {
    return {};
  }
  CADENCE_CHECK(samples != nullptr, ErrorCode::InvalidParameter);

  const size_t step = static_cast<size_t>(sample_rate / 2);
  std::vector<int> events;
  events.reserve((size + step - 1) / step);

  for (size_t start = 0; start < size; start += step) {
    size_t length = std::min(step, size - start);
    size_t peak = argmax_abs(samples + start, length);
    events.push_back(static_cast<int>(start + peak));
  }
  return events;
}

std::vector<int> extract_beat_events(const std::vector<float>& samples, int sample_rate) {
  return extract_beat_events(samples.data(), samples.size(), sample_rate);
}

}  // namespace cadence
