#include "rank_options.hh"
#include "errors.hh"
#include <string>

namespace page_rank {

void ValidateDamping(double damping) {
  // Negated so that NaN is rejected too
  if (!(damping > 0.0 && damping < 1.0)) {
    throw ConfigError("Damping factor must be between 0 and 1, got " +
                      std::to_string(damping));
  }
}

void ValidateSamples(size_t samples) {
  if (samples == 0) {
    throw ConfigError("Number of samples must be a positive integer");
  }
}

void ValidateThreshold(double threshold) {
  if (!(threshold > 0.0)) {
    throw ConfigError("Convergence threshold must be positive, got " +
                      std::to_string(threshold));
  }
}

void ValidateMaxIterations(size_t max_iterations) {
  if (max_iterations == 0) {
    throw ConfigError("Iteration limit must be a positive integer");
  }
}

void ValidateThreadCount(size_t num_threads) {
  if (num_threads == 0) {
    throw ConfigError("Invalid number of threads (0)");
  }
}

void ValidateRankOptions(const RankOptions &options) {
  ValidateDamping(options.damping);
  ValidateSamples(options.samples);
  ValidateThreshold(options.threshold);
  ValidateMaxIterations(options.max_iterations);
  ValidateThreadCount(options.num_threads);
}

uint64_t DeriveSeed(uint64_t seed, SeedStream stream) {
  // splitmix64 finalizer
  uint64_t z = seed + 0x9e3779b97f4a7c15ULL * static_cast<uint64_t>(stream);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

} // namespace page_rank
