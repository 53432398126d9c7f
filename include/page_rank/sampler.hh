#ifndef __PAGE_RANK_SAMPLER_HH__
#define __PAGE_RANK_SAMPLER_HH__

#include "corpus.hh"
#include <cstdint>
#include <ostream>
#include <random>

namespace page_rank {

// Estimate PageRank by a random walk of `samples` steps through `corpus`.
//
// The walk starts on a page drawn uniformly from `rng` and moves according to
// TransitionModel. A page's rank is the fraction of steps spent on it, so the
// result sums to 1 for any sample count. All randomness comes from `rng`:
// the same generator state always yields the same ranks.
//
// Throws ConfigError for a bad damping factor or samples == 0, and
// EmptyCorpusError if the corpus has no pages.
Ranks SamplePagerank(const Corpus &corpus, double damping, size_t samples,
                     std::mt19937_64 &rng);

// Statistics about the most recent parallel sampling run
struct SampleStats {
  uint64_t walks{0};
  uint64_t samples{0};
  uint64_t pages_visited{0}; // Distinct pages seen by at least one walk
  int64_t sample_time_ms{0};
  friend std::ostream &operator<<(std::ostream &os, const SampleStats &stats);
};

// Splits one sampling budget over independent walks run on separate threads.
// Walk i uses its own generator seeded with `seed + i`; visit counts are
// summed before normalizing, so results are reproducible for a fixed seed and
// thread count.
class ParallelSampler {
public:
  ParallelSampler(const Corpus &corpus, double damping,
                  size_t num_threads = 4);

  Ranks Sample(size_t samples, uint64_t seed);

  const SampleStats &GetLastSampleStats() const { return last_sample_stats_; }
  void ResetStats() { last_sample_stats_ = SampleStats(); }

private:
  const Corpus &corpus_;
  double damping_;
  size_t num_threads_;

  SampleStats last_sample_stats_;
};

} // namespace page_rank

#endif
