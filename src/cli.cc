#include "cli.hh"
#include "CLI/CLI.hpp"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <iostream>
#include <map>

namespace page_rank {
bool SetupLogging(const CommonOptions &options) {
  try {
    std::vector<spdlog::sink_ptr> sinks;

    // File sink is always enabled
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file_sink);

    // Console sink only if verbose mode is enabled
    if (options.verbose) {
      auto console_sink =
          std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
      console_sink->set_pattern("[%^%l%$] %v");
      sinks.push_back(console_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("pagerank", sinks.begin(),
                                                   sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(options.log_level);

    spdlog::info("Starting pagerank with damping {}, {} samples, threshold {}",
                 options.damping, options.samples, options.threshold);
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
    return false;
  }
  return true;
}

void AddCommonOptions(CLI::App *app, CommonOptions &options) {
  app->add_flag("-v,--verbose", options.verbose,
                "Enable verbose console output");
  app->add_option("-l,--log-file", options.log_file, "Log file path")
      ->default_val("pagerank.log");

  app->add_option("--log-level", options.log_level,
                  "Log level (trace, debug, info, warn, error, critical)")
      ->default_val(spdlog::level::info)
      ->transform(CLI::CheckedTransformer(
          std::map<std::string, spdlog::level::level_enum>{
              {"trace", spdlog::level::trace},
              {"debug", spdlog::level::debug},
              {"info", spdlog::level::info},
              {"warn", spdlog::level::warn},
              {"error", spdlog::level::err},
              {"critical", spdlog::level::critical}},
          CLI::ignore_case));

  // Open-interval check happens in ValidateRankOptions
  app->add_option("-d,--damping", options.damping,
                  "Probability of following a link (0.0-1.0, exclusive)")
      ->default_val(RankOptions::kDefaultDampingFactor);

  app->add_option("-n,--samples", options.samples,
                  "Number of random-walk samples")
      ->default_val(RankOptions::kDefaultSamples)
      ->check(CLI::PositiveNumber);

  app->add_option("--threshold", options.threshold,
                  "Convergence threshold of the iterative solver")
      ->default_val(RankOptions::kDefaultConvergenceThreshold)
      ->check(CLI::PositiveNumber);

  app->add_option("--max-iterations", options.max_iterations,
                  "Iteration limit of the iterative solver")
      ->default_val(RankOptions::kDefaultMaxIterations)
      ->check(CLI::PositiveNumber);

  app->add_option("--seed", options.seed,
                  "RNG seed for sampling (0 for random)")
      ->default_val(0);

  app->add_option("--threads", options.num_threads,
                  "Number of sampling threads")
      ->default_val(1)
      ->check(CLI::Range(1, 256));

  app->add_option("--top", options.top,
                  "Only print the N highest ranked pages (0 for all)")
      ->default_val(0);
}

CliSubcommands CreateCli(CLI::App &app, CrawlOptions &crawl_opts,
                         RandomOptions &random_opts) {
  // Main program setup
  app.require_subcommand(1, 1);

  auto crawl =
      app.add_subcommand("crawl", "Rank a directory of linked HTML pages");
  auto random =
      app.add_subcommand("random", "Rank a randomly generated web graph");

  AddCommonOptions(crawl, crawl_opts);
  crawl->add_option("corpus", crawl_opts.corpus_dir, "Corpus directory")
      ->check(CLI::ExistingDirectory)
      ->required();

  AddCommonOptions(random, random_opts);
  random->add_option("pages", random_opts.num_pages, "Number of pages")
      ->check(CLI::PositiveNumber)
      ->required();
  random
      ->add_option("-e,--edge-probability", random_opts.edge_probability,
                   "Chance of a link between any two pages")
      ->default_val(0.1)
      ->check(CLI::Range(0.0, 1.0));

  return CliSubcommands{crawl, random};
}

RankOptions ToRankOptions(const CommonOptions &options) {
  RankOptions rank_options;
  rank_options.damping = options.damping;
  rank_options.samples = options.samples;
  rank_options.threshold = options.threshold;
  rank_options.max_iterations = options.max_iterations;
  rank_options.seed = options.seed;
  rank_options.num_threads = options.num_threads;
  return rank_options;
}

} // namespace page_rank
