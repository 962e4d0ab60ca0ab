#include "estimator/bpm_history.h"

#include <numeric>

#include "util/exception.h"
#include "util/math_utils.h"

namespace cadence {

BpmEstimate BpmEstimate::from_value(double bpm) {
  BpmEstimate estimate;
  estimate.bpm = static_cast<float>(bpm);
  estimate.text = format_fixed(bpm, 2);
  return estimate;
}

BpmHistory::BpmHistory(size_t capacity) : capacity_(capacity) {
  CADENCE_CHECK_MSG(capacity > 0, ErrorCode::InvalidParameter,
                    "BPM history capacity must be positive");
}

double BpmHistory::push(double bpm) {
  if (values_.size() == capacity_) {
    values_.pop_front();
  }
  values_.push_back(bpm);
  return average();
}

double BpmHistory::average() const {
  if (values_.empty()) {
    return 0.0;
  }
  double sum = std::accumulate(values_.begin(), values_.end(), 0.0);
  return round_to(sum / static_cast<double>(values_.size()), 2);
}

}  // namespace cadence
