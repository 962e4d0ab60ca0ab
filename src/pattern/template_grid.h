#pragma once

/// @file template_grid.h
/// @brief Synthetic beat-position templates for tempo candidates.
///
/// A grid has shape (candidate_count, window_count, 32). Row (c, x) holds the
/// sample offsets of 32 consecutive beats at the tempo of candidate c, shifted
/// by the phase 20 * (x + 1):
///
///   grid[c][x][y] = y * period(c) + 20 * (x + 1)
///
/// Matching a detected beat against every window row tests all phase
/// alignments of a candidate without an explicit phase search.

#include <Eigen/Core>
#include <cstddef>
#include <cstdint>

#include "util/types.h"

namespace cadence {

/// @brief Constants shared by template generation and matching.
namespace template_constants {
/// @brief Number of predicted beats per template row.
constexpr int kBeatsPerTemplate = 32;

/// @brief Phase offset between consecutive window rows (samples).
constexpr int kPhaseHop = 20;

/// @brief Extra BPM covered below the band base.
constexpr int kBandMargin = 10;
}  // namespace template_constants

/// @brief Configuration for template generation.
struct PatternConfig {
  int sample_rate = 11025;    ///< Sample rate in Hz
  int width = 100;            ///< BPM span of each band
  double coarse_step = 0.25;  ///< Candidate spacing of the coarse grid (BPM)
  double fine_step = 0.05;    ///< Candidate spacing of the fine grid (BPM)

  /// @brief Returns the candidate spacing for a resolution.
  double step(Resolution r) const { return r == Resolution::Coarse ? coarse_step : fine_step; }

  /// @brief Returns the number of candidates, round((width + 10) / step).
  int candidate_count(Resolution r) const;

  /// @brief Returns the number of phase rows, (sample_rate / 2) / 20.
  int window_count() const { return (sample_rate / 2) / template_constants::kPhaseHop; }
};

class TemplateGridView;

/// @brief Immutable template grid for one band at one resolution.
class TemplateGrid {
 public:
  /// @brief Row storage: one row per (candidate, window) pair.
  using Rows = Eigen::Matrix<int32_t, Eigen::Dynamic, template_constants::kBeatsPerTemplate,
                             Eigen::RowMajor>;

  /// @brief Default constructor creates an empty grid.
  TemplateGrid();

  /// @brief Creates a zero-filled grid with the given shape.
  /// @param base_bpm Band base BPM
  /// @param resolution Grid resolution
  /// @param sample_rate Sample rate in Hz
  /// @param step Candidate spacing in BPM
  /// @param candidate_count Number of candidates
  /// @param window_count Number of phase rows per candidate
  TemplateGrid(int base_bpm, Resolution resolution, int sample_rate, double step,
               int candidate_count, int window_count);

  /// @brief Generates the grid for a band base.
  /// @param base_bpm Band base BPM (60, 130 or 210)
  /// @param resolution Coarse or fine
  /// @param config Pattern configuration
  /// @return Generated grid
  static TemplateGrid generate(int base_bpm, Resolution resolution,
                               const PatternConfig& config = PatternConfig());

  int base_bpm() const { return base_bpm_; }
  Resolution resolution() const { return resolution_; }
  int sample_rate() const { return sample_rate_; }
  double step() const { return step_; }
  int candidate_count() const { return candidate_count_; }
  int window_count() const { return window_count_; }
  bool empty() const { return candidate_count_ == 0; }

  /// @brief Hypothesized tempo of a candidate.
  /// @details Coarse candidates start one step above base - 10, fine candidates
  ///          start at base - 10.
  double candidate_bpm(int candidate) const;

  /// @brief Beat period of a candidate in samples.
  int32_t period_samples(int candidate) const;

  /// @brief Returns the 32 beat offsets of row (candidate, window).
  const int32_t* row(int candidate, int window) const {
    return rows_.data() +
           (static_cast<size_t>(candidate) * window_count_ + window) *
               template_constants::kBeatsPerTemplate;
  }

  /// @brief Returns entry [candidate][window][beat].
  int32_t at(int candidate, int window, int beat) const { return row(candidate, window)[beat]; }

  /// @brief Raw row-major data of size candidate_count * window_count * 32.
  const int32_t* data() const { return rows_.data(); }
  int32_t* mutable_data() { return rows_.data(); }
  size_t size() const { return static_cast<size_t>(rows_.size()); }

  /// @brief Returns a view over all candidates.
  TemplateGridView view() const;

  /// @brief Returns a view over candidates [first, first + count).
  /// @throws CadenceException if the range is out of bounds
  TemplateGridView view(int first, int count) const;

  /// @brief Returns true if shape, parameters and content are identical.
  bool operator==(const TemplateGrid& other) const;
  bool operator!=(const TemplateGrid& other) const { return !(*this == other); }

 private:
  int base_bpm_;
  Resolution resolution_;
  int sample_rate_;
  double step_;
  int candidate_count_;
  int window_count_;
  Rows rows_;
};

/// @brief Read-only window over a contiguous candidate range of a grid.
class TemplateGridView {
 public:
  TemplateGridView(const TemplateGrid& grid, int first, int count)
      : grid_(&grid), first_(first), count_(count) {}

  const TemplateGrid& grid() const { return *grid_; }
  int first() const { return first_; }
  int candidate_count() const { return count_; }
  int window_count() const { return grid_->window_count(); }

  /// @brief Row of a candidate relative to the view start.
  const int32_t* row(int candidate, int window) const {
    return grid_->row(first_ + candidate, window);
  }

 private:
  const TemplateGrid* grid_;
  int first_;
  int count_;
};

}  // namespace cadence
