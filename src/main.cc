#include "CLI/CLI.hpp"
#include "cli.hh"
#include "crawler.hh"
#include "errors.hh"
#include "iterative_solver.hh"
#include "report.hh"
#include "sampler.hh"
#include "spdlog/spdlog.h"
#include "validator.hh"
#include <chrono>
#include <iostream>
#include <random>
#include <sstream>

namespace {

uint64_t ResolveSeed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  return static_cast<uint64_t>(
      std::chrono::system_clock::now().time_since_epoch().count());
}

void Report(const std::string &header, const page_rank::Ranks &ranks,
            size_t top) {
  if (top == 0) {
    page_rank::PrintRanks(std::cout, header, ranks);
  } else {
    page_rank::PrintRanks(std::cout, header, page_rank::TopPages(ranks, top));
  }
}

void RankCorpus(const page_rank::Corpus &corpus,
                const page_rank::CommonOptions &opts, uint64_t seed) {
  using namespace page_rank;

  auto options = ToRankOptions(opts);
  options.seed = seed;
  ValidateRankOptions(options);
  ValidateCorpus(corpus);
  if (corpus.empty()) {
    throw EmptyCorpusError();
  }

  const uint64_t sample_seed = DeriveSeed(options.seed, SeedStream::Sampling);
  spdlog::info("Sampling with seed {} on {} thread(s)", sample_seed,
               options.num_threads);

  Ranks sampled;
  if (options.num_threads == 1) {
    std::mt19937_64 rng(sample_seed);
    sampled = SamplePagerank(corpus, options.damping, options.samples, rng);
  } else {
    ParallelSampler sampler(corpus, options.damping, options.num_threads);
    sampled = sampler.Sample(options.samples, sample_seed);
    std::stringstream ss;
    ss << sampler.GetLastSampleStats();
    spdlog::info(ss.str());
  }
  Report(SamplingHeader(options.samples), sampled, opts.top);

  IterativeSolver solver(corpus, options.damping, options.threshold,
                         options.max_iterations);
  auto iterated = solver.Solve();
  std::stringstream ss;
  ss << solver.GetLastSolveStats();
  spdlog::info(ss.str());
  Report(IterationHeader(), iterated, opts.top);
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace page_rank;

  CLI::App app{"Rank pages of a link graph by sampling and by iteration"};
  CrawlOptions crawl_opts;
  RandomOptions random_opts;
  auto subcommands = CreateCli(app, crawl_opts, random_opts);

  CLI11_PARSE(app, argc, argv);

  const bool crawl_mode = subcommands.crawl->parsed();
  const CommonOptions &opts =
      crawl_mode ? static_cast<const CommonOptions &>(crawl_opts)
                 : static_cast<const CommonOptions &>(random_opts);
  if (!SetupLogging(opts)) {
    return 1;
  }

  const uint64_t seed = ResolveSeed(opts.seed);
  spdlog::info("Using seed {}", seed);

  try {
    Corpus corpus;
    if (crawl_mode) {
      corpus = CrawlCorpus(crawl_opts.corpus_dir);
    } else {
      std::mt19937_64 rng(DeriveSeed(seed, SeedStream::Corpus));
      corpus = GenerateRandomCorpus(random_opts.num_pages,
                                    random_opts.edge_probability, rng);
    }
    RankCorpus(corpus, opts, seed);
  } catch (const PageRankError &e) {
    spdlog::error(e.what());
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  spdlog::info("Done");
  return 0;
}
