#include "iterative_solver.hh"
#include "errors.hh"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace page_rank {

IterativeSolver::IterativeSolver(const Corpus &corpus, double damping,
                                 double threshold, size_t max_iterations)
    : corpus_(corpus), damping_(damping), threshold_(threshold),
      max_iterations_(max_iterations) {
  ValidateDamping(damping);
  ValidateThreshold(threshold);
  ValidateMaxIterations(max_iterations);
}

Ranks IterativeSolver::Step(const Ranks &ranks) const {
  if (corpus_.empty()) {
    throw EmptyCorpusError();
  }
  const auto n = static_cast<double>(corpus_.size());

  // Reset next ranks to the random-jump share
  Ranks next_ranks;
  for (const auto &entry : corpus_) {
    next_ranks.emplace_hint(next_ranks.end(), entry.first,
                            (1.0 - damping_) / n);
  }

  // Distribute rank via links. Sinks spread theirs over every page.
  double sink_rank = 0.0;
  for (const auto &[page, links] : corpus_) {
    auto it = ranks.find(page);
    if (it == ranks.end()) {
      throw CorpusError("No rank given for page '" + page + "'");
    }
    if (links.empty()) {
      sink_rank += it->second;
      continue;
    }
    double out_rank = damping_ * it->second / static_cast<double>(links.size());
    for (const auto &target : links) {
      next_ranks.at(target) += out_rank;
    }
  }

  if (sink_rank > 0.0) {
    double share = damping_ * sink_rank / n;
    for (auto &entry : next_ranks) {
      entry.second += share;
    }
  }
  return next_ranks;
}

Ranks IterativeSolver::Solve() {
  if (corpus_.empty()) {
    throw EmptyCorpusError();
  }

  auto start_time = std::chrono::steady_clock::now();
  ResetStats();

  const double initial = 1.0 / static_cast<double>(corpus_.size());
  Ranks ranks;
  for (const auto &entry : corpus_) {
    ranks.emplace_hint(ranks.end(), entry.first, initial);
  }

  while (true) {
    auto next_ranks = Step(ranks);
    ++last_solve_stats_.iterations;

    // Compute difference
    double max_delta = 0.0;
    for (const auto &[page, rank] : next_ranks) {
      max_delta = std::max(max_delta, std::abs(rank - ranks.at(page)));
    }
    last_solve_stats_.max_delta = max_delta;
    spdlog::trace("Iteration {}: max delta {}", last_solve_stats_.iterations,
                  max_delta);

    // Stable within tolerance: keep the ranks the last step was measured from
    if (max_delta < threshold_) {
      break;
    }
    ranks = std::move(next_ranks);
    if (last_solve_stats_.iterations >= max_iterations_) {
      std::ostringstream ss;
      ss << "PageRank did not converge within " << max_iterations_
         << " iterations (last max delta " << max_delta << ", threshold "
         << threshold_ << ")";
      spdlog::error(ss.str());
      throw ConvergenceError(ss.str());
    }
  }

  auto end_time = std::chrono::steady_clock::now();
  last_solve_stats_.solve_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(end_time -
                                                            start_time)
          .count();
  spdlog::debug("Converged after {} iterations",
                last_solve_stats_.iterations);
  return ranks;
}

Ranks IteratePagerank(const Corpus &corpus, double damping) {
  IterativeSolver solver(corpus, damping);
  return solver.Solve();
}

std::ostream &operator<<(std::ostream &os, const SolveStats &stats) {
  std::ostringstream delta;
  delta << std::scientific << std::setprecision(3) << stats.max_delta;
  os << "Solve Statistics:\n"
     << std::dec << "  Iterations:          " << stats.iterations << "\n"
     << "  Final max delta:     " << delta.str() << "\n"
     << "  Solve time:          " << stats.solve_time_ms << " ms";
  return os;
}

} // namespace page_rank
