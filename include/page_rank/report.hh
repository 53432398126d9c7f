#ifndef __PAGE_RANK_REPORT_HH__
#define __PAGE_RANK_REPORT_HH__

#include "corpus.hh"
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace page_rank {

std::string SamplingHeader(size_t samples);
std::string IterationHeader();

// Writes `header`, then "  <page>: <rank>" for every page in identifier
// order with the rank fixed to 4 decimal places.
void PrintRanks(std::ostream &os, const std::string &header,
                const Ranks &ranks);

// Same line format, limited to the given (already ordered) pages.
void PrintRanks(std::ostream &os, const std::string &header,
                const std::vector<std::pair<Page, double>> &ranks);

// Get top N pages by rank. Ties are broken by page identifier.
std::vector<std::pair<Page, double>> TopPages(const Ranks &ranks, size_t n);

} // namespace page_rank

#endif
