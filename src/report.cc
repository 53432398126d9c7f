#include "report.hh"
#include <algorithm>
#include <iomanip>

namespace page_rank {

std::string SamplingHeader(size_t samples) {
  return "PageRank Results from Sampling (n = " + std::to_string(samples) +
         ")";
}

std::string IterationHeader() { return "PageRank Results from Iteration"; }

namespace {
void PrintLine(std::ostream &os, const Page &page, double rank) {
  os << "  " << page << ": " << std::fixed << std::setprecision(4) << rank
     << "\n";
}
} // namespace

void PrintRanks(std::ostream &os, const std::string &header,
                const Ranks &ranks) {
  os << header << "\n";
  for (const auto &[page, rank] : ranks) {
    PrintLine(os, page, rank);
  }
}

void PrintRanks(std::ostream &os, const std::string &header,
                const std::vector<std::pair<Page, double>> &ranks) {
  os << header << "\n";
  for (const auto &[page, rank] : ranks) {
    PrintLine(os, page, rank);
  }
}

std::vector<std::pair<Page, double>> TopPages(const Ranks &ranks, size_t n) {
  std::vector<std::pair<Page, double>> top(ranks.begin(), ranks.end());

  // Sort by rank
  std::partial_sort(
      top.begin(), top.begin() + static_cast<long>(std::min(n, top.size())),
      top.end(), [](const auto &a, const auto &b) {
        if (a.second != b.second) {
          return a.second > b.second;
        }
        return a.first < b.first;
      });

  top.resize(std::min(n, top.size()));
  return top;
}

} // namespace page_rank
