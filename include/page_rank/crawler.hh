#ifndef __PAGE_RANK_CRAWLER_HH__
#define __PAGE_RANK_CRAWLER_HH__

#include "corpus.hh"
#include <string>

namespace page_rank {

// Parse a directory of HTML pages into a corpus.
// directory: Directory holding the pages. Only "*.html" files directly
//            inside it are read.
// Returns: Every page mapped to the pages of the corpus it links to, with
//          self-references and links leaving the corpus removed.
// Throws CrawlError if the directory or one of its pages cannot be read.
Corpus CrawlCorpus(const std::string &directory);

// Link targets of every <a href="..."> element in `contents`, in document
// order and with duplicates kept.
std::vector<std::string> ExtractLinks(const std::string &contents);

} // namespace page_rank

#endif
