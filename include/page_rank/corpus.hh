#ifndef __PAGE_RANK_CORPUS_HH__
#define __PAGE_RANK_CORPUS_HH__

#include <cstddef>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace page_rank {

using Page = std::string;

// Directed link graph: every page maps to the set of pages it links to.
// Ordered containers keep iteration (and therefore seeded sampling)
// deterministic.
using Corpus = std::map<Page, std::set<Page>>;

// Page -> probability / rank value. Sums to 1 over all pages of a corpus.
using Distribution = std::map<Page, double>;
using Ranks = std::map<Page, double>;

// All pages of the corpus in identifier order.
std::vector<Page> Pages(const Corpus &corpus);

// Number of links in the corpus.
size_t LinkCount(const Corpus &corpus);

// Pages with no outbound links.
std::vector<Page> Sinks(const Corpus &corpus);

// Create a random web graph of `num_pages` pages named "<i>.html". Every
// ordered pair of distinct pages is linked with `edge_probability`.
// Throws ConfigError if edge_probability is outside [0, 1].
Corpus GenerateRandomCorpus(size_t num_pages, double edge_probability,
                            std::mt19937_64 &rng);

} // namespace page_rank

#endif
