#include "corpus.hh"
#include "errors.hh"
#include "spdlog/spdlog.h"

namespace page_rank {

std::vector<Page> Pages(const Corpus &corpus) {
  std::vector<Page> pages;
  pages.reserve(corpus.size());
  for (const auto &[page, links] : corpus) {
    (void)links;
    pages.push_back(page);
  }
  return pages;
}

size_t LinkCount(const Corpus &corpus) {
  size_t count = 0;
  for (const auto &[page, links] : corpus) {
    (void)page;
    count += links.size();
  }
  return count;
}

std::vector<Page> Sinks(const Corpus &corpus) {
  std::vector<Page> sinks;
  for (const auto &[page, links] : corpus) {
    if (links.empty()) {
      sinks.push_back(page);
    }
  }
  return sinks;
}

Corpus GenerateRandomCorpus(size_t num_pages, double edge_probability,
                            std::mt19937_64 &rng) {
  if (!(edge_probability >= 0.0 && edge_probability <= 1.0)) {
    throw ConfigError("Edge probability must be between 0 and 1, got " +
                      std::to_string(edge_probability));
  }
  std::uniform_real_distribution<> dist(0.0, 1.0);

  // Create pages
  std::vector<Page> pages;
  pages.reserve(num_pages);
  for (size_t i = 0; i < num_pages; ++i) {
    pages.push_back(std::to_string(i) + ".html");
  }

  // Create random edges
  Corpus corpus;
  for (const auto &page : pages) {
    auto &links = corpus[page];
    for (const auto &target : pages) {
      if (page != target && dist(rng) < edge_probability) {
        links.insert(target);
      }
    }
  }

  spdlog::debug("Generated corpus with {} pages and {} links", corpus.size(),
                LinkCount(corpus));
  return corpus;
}

} // namespace page_rank
