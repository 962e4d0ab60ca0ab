#pragma once

/// @file tempo_search.h
/// @brief Coarse-to-fine tempo search by template voting.
///
/// @section tempo_search_algorithm Algorithm
///
/// Each beat event is compared with every entry of every template row. An
/// entry within +-20 samples of the event is a match and adds one vote to
/// the (candidate, window row) cell it belongs to. A candidate's score is the
/// largest cell count of its rows, i.e. the frequency of its most common
/// window row. This favours tempos for which many events agree on a single
/// phase.
///
/// The best candidate is accepted only if it is unique and has at least six
/// votes. The coarse winner selects a 40-candidate slice of the fine grid
/// around it; the same events are voted against that slice and the fine
/// winner gives the final tempo with 0.05 BPM resolution. A coarse winner
/// whose slice would start before the first fine candidate yields no result.

#include <Eigen/Core>
#include <optional>
#include <vector>

#include "pattern/pattern_factory.h"
#include "pattern/template_grid.h"

namespace cadence {

/// @brief Constants of the voting search.
namespace search_constants {
/// @brief Maximum distance between an event and a template entry (samples).
constexpr int kMatchTolerance = 20;

/// @brief Minimum number of votes for a confident result.
constexpr int kMinVotes = 6;

/// @brief Number of fine candidates searched around the coarse winner.
constexpr int kFineWindow = 40;
}  // namespace search_constants

/// @brief Winner of one voting pass.
struct VoteResult {
  int candidate;  ///< Candidate index relative to the searched view
  int votes;      ///< Frequency of the candidate's most common window row
};

/// @brief Result of a full coarse-to-fine search.
struct TempoSearchResult {
  double bpm;            ///< Final tempo, rounded to 2 decimals
  int coarse_candidate;  ///< Winning coarse candidate
  int coarse_votes;      ///< Votes of the coarse winner
  int fine_start;        ///< First fine candidate of the refinement slice
  int fine_candidate;    ///< Winning candidate within the slice
  int fine_votes;        ///< Votes of the fine winner
};

/// @brief Template-voting tempo search.
/// @details Keeps its vote accumulators between calls so that repeated
///          searches do not allocate. Not thread-safe.
class TempoVotingSearch {
 public:
  TempoVotingSearch() = default;

  /// @brief Runs one voting pass over a view of a template grid.
  /// @param events Beat events (absolute sample offsets)
  /// @param view Candidates to vote on
  /// @return The unique winner with at least kMinVotes votes, or std::nullopt
  std::optional<VoteResult> vote(const std::vector<int>& events, const TemplateGridView& view);

  /// @brief Runs the coarse pass and the fine refinement.
  /// @param events Beat events (absolute sample offsets)
  /// @param templates Coarse and fine grids of the active band
  /// @return Tempo estimate, or std::nullopt if either pass is not confident
  std::optional<TempoSearchResult> search(const std::vector<int>& events,
                                          const BandTemplates& templates);

  /// @brief First fine candidate of the refinement slice for a coarse winner.
  /// @details round(coarse * coarse_step / fine_step) - 20. A slice reaching
  ///          past the end of the fine grid is truncated by the caller.
  /// @return The start, or std::nullopt if it lies before the first fine
  ///         candidate (the winner is too close to the band floor to refine)
  static std::optional<int> fine_window_start(int coarse_candidate, const TemplateGrid& coarse,
                                              const TemplateGrid& fine);

  /// @brief Per-candidate votes of the last pass.
  Eigen::Ref<const Eigen::VectorXi> last_votes() const { return votes_.head(last_count_); }

 private:
  void tally(const std::vector<int>& events, const TemplateGridView& view);

  Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> counts_;
  Eigen::VectorXi votes_;
  Eigen::Index last_count_ = 0;
};

}  // namespace cadence
