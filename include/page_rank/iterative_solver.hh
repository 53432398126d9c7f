#ifndef __PAGE_RANK_ITERATIVE_SOLVER_HH__
#define __PAGE_RANK_ITERATIVE_SOLVER_HH__

#include "corpus.hh"
#include "rank_options.hh"
#include <cstdint>
#include <ostream>

namespace page_rank {

// Statistics about the most recent Solve()
struct SolveStats {
  uint64_t iterations{0};
  double max_delta{0.0}; // Largest per-page change in the final iteration
  int64_t solve_time_ms{0};
  friend std::ostream &operator<<(std::ostream &os, const SolveStats &stats);
};

// Computes PageRank by repeatedly applying
//
//   PR(p) = (1 - d) / N + d * sum(PR(q) / L(q))
//
// over every page q linking to p, where pages without links count as linking
// to every page. Starts from 1/N everywhere and stops at the first iteration
// in which no page changed by `threshold` or more.
class IterativeSolver {
public:
  // Throws ConfigError for damping outside (0, 1), a non-positive threshold
  // or max_iterations == 0.
  IterativeSolver(
      const Corpus &corpus, double damping,
      double threshold = RankOptions::kDefaultConvergenceThreshold,
      size_t max_iterations = RankOptions::kDefaultMaxIterations);

  // Run to convergence and return the ranks the converging iteration started
  // from. The converging iteration is counted in the stats.
  // Throws EmptyCorpusError for an empty corpus and ConvergenceError when
  // max_iterations pass without converging.
  Ranks Solve();

  // Single application of the recurrence to `ranks`, which must hold a value
  // for every page of the corpus.
  Ranks Step(const Ranks &ranks) const;

  const SolveStats &GetLastSolveStats() const { return last_solve_stats_; }
  void ResetStats() { last_solve_stats_ = SolveStats(); }

private:
  const Corpus &corpus_;
  double damping_;
  double threshold_;
  size_t max_iterations_;

  SolveStats last_solve_stats_;
};

// Solve with the default threshold and iteration cap.
Ranks IteratePagerank(const Corpus &corpus, double damping);

} // namespace page_rank

#endif
