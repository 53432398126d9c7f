// tests/report_test.cc
#include "page_rank/report.hh"

#include <gtest/gtest.h>
#include <sstream>

namespace page_rank {
namespace {

TEST(ReportTest, Headers) {
  EXPECT_EQ(SamplingHeader(10000), "PageRank Results from Sampling (n = 10000)");
  EXPECT_EQ(IterationHeader(), "PageRank Results from Iteration");
}

TEST(ReportTest, PrintsPagesSortedWithFourDecimals) {
  Ranks ranks{{"2.html", 0.25}, {"1.html", 0.123456}, {"10.html", 0.626544}};
  std::stringstream ss;
  PrintRanks(ss, IterationHeader(), ranks);
  EXPECT_EQ(ss.str(), "PageRank Results from Iteration\n"
                      "  1.html: 0.1235\n"
                      "  10.html: 0.6265\n"
                      "  2.html: 0.2500\n");
}

TEST(ReportTest, TopPagesOrdersByRankThenName) {
  Ranks ranks{{"a", 0.1}, {"b", 0.4}, {"c", 0.1}, {"d", 0.4}};
  auto top = TopPages(ranks, 3);
  ASSERT_EQ(top.size(), 3u);
  EXPECT_EQ(top[0].first, "b");
  EXPECT_EQ(top[1].first, "d");
  EXPECT_EQ(top[2].first, "a");
}

TEST(ReportTest, TopPagesClampsToRankCount) {
  Ranks ranks{{"a", 0.5}, {"b", 0.5}};
  EXPECT_EQ(TopPages(ranks, 10).size(), 2u);
  EXPECT_TRUE(TopPages(ranks, 0).empty());
}

TEST(ReportTest, PrintsTopPagesInGivenOrder) {
  Ranks ranks{{"a", 0.2}, {"b", 0.8}};
  std::stringstream ss;
  PrintRanks(ss, SamplingHeader(5), TopPages(ranks, 2));
  EXPECT_EQ(ss.str(), "PageRank Results from Sampling (n = 5)\n"
                      "  b: 0.8000\n"
                      "  a: 0.2000\n");
}

} // namespace
} // namespace page_rank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
