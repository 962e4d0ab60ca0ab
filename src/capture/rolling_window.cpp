#include "capture/rolling_window.h"

#include <algorithm>

#include "util/exception.h"

namespace cadence {

RollingAudioWindow::RollingAudioWindow(size_t capacity) : buffer_(capacity) {
  CADENCE_CHECK_MSG(capacity > 0, ErrorCode::InvalidParameter,
                    "Rolling window capacity must be positive");
}

void RollingAudioWindow::append(const Sample* samples, size_t count) {
  if (count == 0) {
    return;
  }
  CADENCE_CHECK(samples != nullptr, ErrorCode::InvalidParameter);

  const size_t cap = buffer_.size();

  // Only the last `cap` samples of a long block can survive.
  if (count >= cap) {
    std::copy(samples + (count - cap), samples + count, buffer_.begin());
    head_ = 0;
    size_ = cap;
    return;
  }

  size_t tail = (head_ + size_) % cap;
  size_t first = std::min(count, cap - tail);
  std::copy(samples, samples + first, buffer_.begin() + tail);
  std::copy(samples + first, samples + count, buffer_.begin());

  size_t total = size_ + count;
  if (total > cap) {
    head_ = (head_ + (total - cap)) % cap;
    size_ = cap;
  } else {
    size_ = total;
  }
}

std::vector<Sample> RollingAudioWindow::to_vector() const {
  std::vector<Sample> out(size_);
  const size_t cap = buffer_.size();
  size_t first = std::min(size_, cap - head_);
  std::copy(buffer_.begin() + head_, buffer_.begin() + head_ + first, out.begin());
  std::copy(buffer_.begin(), buffer_.begin() + (size_ - first), out.begin() + first);
  return out;
}

void RollingAudioWindow::clear() {
  head_ = 0;
  size_ = 0;
}

}  // namespace cadence
