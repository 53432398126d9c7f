#include "sampler.hh"
#include "errors.hh"
#include "rank_options.hh"
#include "spdlog/spdlog.h"
#include "thread_guard.hh"
#include "transition_model.hh"
#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>
#include <vector>

namespace page_rank {

namespace {

// One walk of `samples` steps. counts[i] is incremented for every step spent
// on pages[i].
void Walk(const Corpus &corpus, const std::vector<Page> &pages,
          double damping, size_t samples, std::mt19937_64 &rng,
          std::vector<uint64_t> &counts) {
  std::uniform_int_distribution<size_t> start_dist(0, pages.size() - 1);
  size_t current = start_dist(rng);

  std::vector<double> weights(pages.size());
  for (size_t i = 0; i < samples; ++i) {
    counts[current]++;

    // Distribution keys share the corpus order, so weights line up with pages
    auto model = TransitionModel(corpus, pages[current], damping);
    std::transform(model.begin(), model.end(), weights.begin(),
                   [](const auto &entry) { return entry.second; });

    std::discrete_distribution<size_t> next_dist(weights.begin(),
                                                 weights.end());
    current = next_dist(rng);
  }
}

Ranks Normalize(const std::vector<Page> &pages,
                const std::vector<uint64_t> &counts, size_t samples) {
  Ranks ranks;
  for (size_t i = 0; i < pages.size(); ++i) {
    ranks.emplace_hint(ranks.end(), pages[i],
                       static_cast<double>(counts[i]) /
                           static_cast<double>(samples));
  }
  return ranks;
}

} // namespace

Ranks SamplePagerank(const Corpus &corpus, double damping, size_t samples,
                     std::mt19937_64 &rng) {
  ValidateDamping(damping);
  ValidateSamples(samples);
  if (corpus.empty()) {
    throw EmptyCorpusError();
  }

  auto pages = Pages(corpus);
  std::vector<uint64_t> counts(pages.size(), 0);
  Walk(corpus, pages, damping, samples, rng, counts);

  spdlog::debug("Sampled {} steps over {} pages", samples, pages.size());
  return Normalize(pages, counts, samples);
}

ParallelSampler::ParallelSampler(const Corpus &corpus, double damping,
                                 size_t num_threads)
    : corpus_(corpus), damping_(damping), num_threads_(num_threads) {
  ValidateDamping(damping);
  ValidateThreadCount(num_threads);
}

Ranks ParallelSampler::Sample(size_t samples, uint64_t seed) {
  ValidateSamples(samples);
  if (corpus_.empty()) {
    throw EmptyCorpusError();
  }

  auto start_time = std::chrono::steady_clock::now();
  ResetStats();

  auto pages = Pages(corpus_);

  // Divide the sample budget among walks, never starting an empty walk
  size_t num_walks = std::min(num_threads_, samples);
  std::vector<size_t> walk_samples(num_walks, samples / num_walks);
  for (size_t i = 0; i < samples % num_walks; ++i) {
    walk_samples[i]++;
  }

  // Per-walk counters, merged after join
  std::vector<std::vector<uint64_t>> walk_counts(
      num_walks, std::vector<uint64_t>(pages.size(), 0));

  std::vector<std::thread> threads;
  ThreadGuard guard(threads);
  try {
    for (size_t walk_id = 0; walk_id < num_walks; ++walk_id) {
      threads.emplace_back([this, walk_id, seed, &pages, &walk_samples,
                            &walk_counts]() {
        std::mt19937_64 rng(seed + walk_id);
        Walk(corpus_, pages, damping_, walk_samples[walk_id], rng,
             walk_counts[walk_id]);
      });
    }
  } catch (const std::system_error &e) {
    spdlog::error("Unable to start sampling thread: {}", e.what());
    throw PageRankError(std::string("Unable to start sampling thread: ") +
                        e.what());
  }
  guard.JoinAll();

  // Merge counts
  std::vector<uint64_t> counts(pages.size(), 0);
  for (const auto &local : walk_counts) {
    for (size_t i = 0; i < counts.size(); ++i) {
      counts[i] += local[i];
    }
  }

  last_sample_stats_.walks = num_walks;
  last_sample_stats_.samples = samples;
  last_sample_stats_.pages_visited = static_cast<uint64_t>(
      std::count_if(counts.begin(), counts.end(),
                    [](uint64_t count) { return count > 0; }));

  auto end_time = std::chrono::steady_clock::now();
  last_sample_stats_.sample_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(end_time -
                                                            start_time)
          .count();

  return Normalize(pages, counts, samples);
}

std::ostream &operator<<(std::ostream &os, const SampleStats &stats) {
  os << "Sample Statistics:\n"
     << std::dec << "  Walks:               " << stats.walks << "\n"
     << "  Samples:             " << stats.samples << "\n"
     << "  Pages visited:       " << stats.pages_visited << "\n"
     << "  Sample time:         " << stats.sample_time_ms << " ms";
  return os;
}

} // namespace page_rank
