#include "analysis/tempo_search.h"

#include <algorithm>
#include <cmath>

#include "util/math_utils.h"

namespace cadence {

using search_constants::kFineWindow;
using search_constants::kMatchTolerance;
using search_constants::kMinVotes;
using template_constants::kBeatsPerTemplate;

void TempoVotingSearch::tally(const std::vector<int>& events, const TemplateGridView& view) {
  const Eigen::Index n_candidates = view.candidate_count();
  const Eigen::Index n_windows = view.window_count();

  // Grow only; the fine pass reuses the top rows of the coarse-sized buffer.
  if (counts_.rows() < n_candidates || counts_.cols() != n_windows) {
    counts_.resize(std::max(counts_.rows(), n_candidates), n_windows);
    votes_.resize(counts_.rows());
  }
  counts_.topRows(n_candidates).setZero();

  for (int event : events) {
    const int lower = event - kMatchTolerance;
    const int upper = event + kMatchTolerance;
    for (Eigen::Index c = 0; c < n_candidates; ++c) {
      for (Eigen::Index w = 0; w < n_windows; ++w) {
        const int32_t* row = view.row(static_cast<int>(c), static_cast<int>(w));
        const int32_t* end = row + kBeatsPerTemplate;
        // Rows are strictly increasing.
        if (upper < row[0] || lower > end[-1]) {
          continue;
        }
        const int32_t* first = std::lower_bound(row, end, lower);
        const int32_t* last = std::upper_bound(first, end, upper);
        counts_(c, w) += static_cast<int>(last - first);
      }
    }
  }

  // Score = frequency of the most common window row.
  votes_.head(n_candidates) = counts_.topRows(n_candidates).rowwise().maxCoeff();
  last_count_ = n_candidates;
}

std::optional<VoteResult> TempoVotingSearch::vote(const std::vector<int>& events,
                                                  const TemplateGridView& view) {
  if (view.candidate_count() == 0 || view.window_count() == 0) {
    last_count_ = 0;
    return std::nullopt;
  }

  tally(events, view);

  auto scores = votes_.head(last_count_);
  Eigen::Index best = 0;
  int max_votes = scores.maxCoeff(&best);
  auto n_best = (scores.array() == max_votes).count();

  if (n_best > 1 || max_votes < kMinVotes) {
    return std::nullopt;
  }
  return VoteResult{static_cast<int>(best), max_votes};
}

std::optional<int> TempoVotingSearch::fine_window_start(int coarse_candidate,
                                                        const TemplateGrid& coarse,
                                                        const TemplateGrid& fine) {
  auto center = static_cast<int>(
      std::lround(coarse_candidate * coarse.step() / fine.step()));
  int start = center - kFineWindow / 2;
  if (start < 0 || start >= fine.candidate_count()) {
    return std::nullopt;
  }
  return start;
}

std::optional<TempoSearchResult> TempoVotingSearch::search(const std::vector<int>& events,
                                                           const BandTemplates& templates) {
  if (events.empty()) {
    return std::nullopt;
  }

  auto coarse = vote(events, templates.coarse.view());
  if (!coarse) {
    return std::nullopt;
  }

  auto start = fine_window_start(coarse->candidate, templates.coarse, templates.fine);
  if (!start) {
    return std::nullopt;
  }
  int fine_start = *start;
  int fine_count = std::min(kFineWindow, templates.fine.candidate_count() - fine_start);
  auto fine = vote(events, templates.fine.view(fine_start, fine_count));
  if (!fine) {
    return std::nullopt;
  }

  TempoSearchResult result;
  result.bpm = round_to(templates.fine.candidate_bpm(fine_start + fine->candidate), 2);
  result.coarse_candidate = coarse->candidate;
  result.coarse_votes = coarse->votes;
  result.fine_start = fine_start;
  result.fine_candidate = fine->candidate;
  result.fine_votes = fine->votes;
  return result;
}

}  // namespace cadence
