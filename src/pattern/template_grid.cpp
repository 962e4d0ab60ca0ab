#include "pattern/template_grid.h"

#include <algorithm>
#include <cmath>

#include "util/exception.h"

namespace cadence {

using template_constants::kBandMargin;
using template_constants::kBeatsPerTemplate;
using template_constants::kPhaseHop;

int PatternConfig::candidate_count(Resolution r) const {
  return static_cast<int>(std::lround((width + kBandMargin) / step(r)));
}

TemplateGrid::TemplateGrid()
    : base_bpm_(0),
      resolution_(Resolution::Coarse),
      sample_rate_(0),
      step_(0.0),
      candidate_count_(0),
      window_count_(0) {}

TemplateGrid::TemplateGrid(int base_bpm, Resolution resolution, int sample_rate, double step,
                           int candidate_count, int window_count)
    : base_bpm_(base_bpm),
      resolution_(resolution),
      sample_rate_(sample_rate),
      step_(step),
      candidate_count_(candidate_count),
      window_count_(window_count) {
  CADENCE_CHECK(candidate_count >= 0 && window_count >= 0, ErrorCode::InvalidParameter);
  rows_ = Rows::Zero(static_cast<Eigen::Index>(candidate_count) * window_count, kBeatsPerTemplate);
}

TemplateGrid TemplateGrid::generate(int base_bpm, Resolution resolution,
                                    const PatternConfig& config) {
  CADENCE_CHECK_MSG(base_bpm > kBandMargin, ErrorCode::InvalidParameter,
                    "Template base BPM must exceed the band margin");
  CADENCE_CHECK(config.sample_rate > 0 && config.width > 0, ErrorCode::InvalidParameter);
  CADENCE_CHECK(config.step(resolution) > 0.0, ErrorCode::InvalidParameter);

  TemplateGrid grid(base_bpm, resolution, config.sample_rate, config.step(resolution),
                    config.candidate_count(resolution), config.window_count());

  using BeatRow = Eigen::Array<int32_t, 1, kBeatsPerTemplate>;
  const BeatRow beat_index = BeatRow::LinSpaced(kBeatsPerTemplate, 0, kBeatsPerTemplate - 1);

  for (int c = 0; c < grid.candidate_count_; ++c) {
    double bpm = grid.candidate_bpm(c);
    auto period = static_cast<int32_t>(std::lround(60.0 / bpm * config.sample_rate));
    const BeatRow beats = beat_index * period;

    Eigen::Index base_row = static_cast<Eigen::Index>(c) * grid.window_count_;
    for (int x = 0; x < grid.window_count_; ++x) {
      grid.rows_.row(base_row + x) = (beats + kPhaseHop * (x + 1)).matrix();
    }
  }

  return grid;
}

double TemplateGrid::candidate_bpm(int candidate) const {
  int offset = resolution_ == Resolution::Coarse ? candidate + 1 : candidate;
  return static_cast<double>(base_bpm_ - kBandMargin) + offset * step_;
}

int32_t TemplateGrid::period_samples(int candidate) const {
  CADENCE_CHECK(candidate >= 0 && candidate < candidate_count_ && window_count_ > 0,
                ErrorCode::InvalidParameter);
  return at(candidate, 0, 1) - at(candidate, 0, 0);
}

TemplateGridView TemplateGrid::view() const { return TemplateGridView(*this, 0, candidate_count_); }

TemplateGridView TemplateGrid::view(int first, int count) const {
  CADENCE_CHECK_MSG(first >= 0 && count >= 0 && first + count <= candidate_count_,
                    ErrorCode::InvalidParameter, "Template view out of range");
  return TemplateGridView(*this, first, count);
}

bool TemplateGrid::operator==(const TemplateGrid& other) const {
  return base_bpm_ == other.base_bpm_ && resolution_ == other.resolution_ &&
         sample_rate_ == other.sample_rate_ && step_ == other.step_ &&
         candidate_count_ == other.candidate_count_ && window_count_ == other.window_count_ &&
         rows_ == other.rows_;
}

}  // namespace cadence
