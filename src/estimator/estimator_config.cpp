#include "estimator/estimator_config.h"

#include "util/exception.h"

namespace cadence {

void EstimatorConfig::validate() const {
  CADENCE_CHECK_MSG(pattern.sample_rate == capture.sample_rate, ErrorCode::InvalidParameter,
                    "Templates and capture must use the same sample rate");
  CADENCE_CHECK_MSG(average_window > 0, ErrorCode::InvalidParameter,
                    "Average window must hold at least one estimate");
  CADENCE_CHECK_MSG(filter.high_hz < capture.sample_rate / 2.0f, ErrorCode::InvalidParameter,
                    "Pre-filter upper edge must be below Nyquist");
}

}  // namespace cadence
