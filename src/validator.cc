#include "validator.hh"
#include "errors.hh"
#include "spdlog/spdlog.h"

namespace page_rank {

namespace {
[[noreturn]] void Reject(const std::string &message) {
  spdlog::error("Invalid corpus: {}", message);
  throw CorpusError(message);
}
} // namespace

void ValidateCorpus(const Corpus &corpus) {
  for (const auto &[page, links] : corpus) {
    if (page.empty()) {
      Reject("Page identifiers must not be empty");
    }
    for (const auto &link : links) {
      if (link.empty()) {
        Reject("Page '" + page + "' has a link with an empty target");
      }
      if (link == page) {
        Reject("Page '" + page + "' links to itself");
      }
      if (corpus.find(link) == corpus.end()) {
        Reject("Page '" + page + "' links to '" + link +
               "', which is not in the corpus");
      }
    }
  }
}

} // namespace page_rank
