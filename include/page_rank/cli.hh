#ifndef __PAGE_RANK_CLI_HH__
#define __PAGE_RANK_CLI_HH__
#include "CLI/App.hpp"
#include "rank_options.hh"
#include "spdlog/common.h"
#include <cstddef>
#include <string>

namespace page_rank {

struct CommonOptions {
  bool verbose{false};
  std::string log_file;
  spdlog::level::level_enum log_level{spdlog::level::info};
  double damping{RankOptions::kDefaultDampingFactor};
  size_t samples{RankOptions::kDefaultSamples};
  double threshold{RankOptions::kDefaultConvergenceThreshold};
  size_t max_iterations{RankOptions::kDefaultMaxIterations};
  uint64_t seed{0};
  size_t num_threads{1};
  size_t top{0}; // 0 prints every page
};

struct CrawlOptions : CommonOptions {
  std::string corpus_dir;
};

struct RandomOptions : CommonOptions {
  size_t num_pages{0};
  double edge_probability{0.1};
};

struct CliSubcommands {
  CLI::App *crawl;
  CLI::App *random;
};

void AddCommonOptions(CLI::App *app, CommonOptions &options);
CliSubcommands CreateCli(CLI::App &app, CrawlOptions &crawl_opts,
                         RandomOptions &random_opts);

// Returns false if the log sinks could not be created.
bool SetupLogging(const CommonOptions &options);

RankOptions ToRankOptions(const CommonOptions &options);

} // namespace page_rank
#endif
