#ifndef __PAGE_RANK_RANK_OPTIONS_HH__
#define __PAGE_RANK_RANK_OPTIONS_HH__

#include <cstddef>
#include <cstdint>

namespace page_rank {

struct RankOptions {
  static constexpr double kDefaultDampingFactor = 0.85;
  static constexpr size_t kDefaultSamples = 10000;
  static constexpr double kDefaultConvergenceThreshold = 0.001;
  static constexpr size_t kDefaultMaxIterations = 10000;

  double damping{kDefaultDampingFactor};
  size_t samples{kDefaultSamples};
  double threshold{kDefaultConvergenceThreshold};
  size_t max_iterations{kDefaultMaxIterations};
  uint64_t seed{0}; // 0 seeds from the clock
  size_t num_threads{1};
};

// Each of these throws ConfigError with a message naming the bad value.
void ValidateDamping(double damping);
void ValidateSamples(size_t samples);
void ValidateThreshold(double threshold);
void ValidateMaxIterations(size_t max_iterations);
void ValidateThreadCount(size_t num_threads);

// Checks every field of `options`.
void ValidateRankOptions(const RankOptions &options);

// Consumers of one user seed, each given its own generator stream
enum class SeedStream : uint64_t {
  Corpus = 1,   // Random corpus generation
  Sampling = 2, // Random walks
};

// Seed for `stream`, mixed from `seed` so that two streams never replay the
// same generator sequence.
uint64_t DeriveSeed(uint64_t seed, SeedStream stream);

} // namespace page_rank

#endif
