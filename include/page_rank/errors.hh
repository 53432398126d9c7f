#ifndef __PAGE_RANK_ERRORS_HH__
#define __PAGE_RANK_ERRORS_HH__

#include <stdexcept>
#include <string>

namespace page_rank {

// Base of every error raised by the ranking library. All of them abort the
// current ranking run.
class PageRankError : public std::runtime_error {
public:
  explicit PageRankError(const std::string &what) : std::runtime_error(what) {}
};

// Damping, sample count, threshold, ... out of range.
class ConfigError : public PageRankError {
public:
  explicit ConfigError(const std::string &what) : PageRankError(what) {}
};

// Corpus failed validation, or a page is not part of it.
class CorpusError : public PageRankError {
public:
  explicit CorpusError(const std::string &what) : PageRankError(what) {}
};

// Ranking requested on a corpus with no pages (N = 0).
class EmptyCorpusError : public PageRankError {
public:
  EmptyCorpusError() : PageRankError("Corpus contains no pages") {}
};

// Iterative solver hit its iteration cap.
class ConvergenceError : public PageRankError {
public:
  explicit ConvergenceError(const std::string &what) : PageRankError(what) {}
};

// Corpus directory could not be read.
class CrawlError : public PageRankError {
public:
  explicit CrawlError(const std::string &what) : PageRankError(what) {}
};

} // namespace page_rank

#endif
