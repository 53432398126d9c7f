// tests/crawler_test.cc
#include "page_rank/crawler.hh"
#include "page_rank/errors.hh"
#include "page_rank/validator.hh"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

namespace page_rank {
namespace {

namespace fs = std::filesystem;

class CrawlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("page_rank_crawler_test_" + std::to_string(getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void WritePage(const std::string &name, const std::string &contents) {
    std::ofstream out(dir_ / name);
    out << contents;
  }

  fs::path dir_;
};

TEST(ExtractLinksTest, FindsHrefOfAnchorTags) {
  auto links = ExtractLinks(
      "<html><body>"
      "<a href=\"1.html\">One</a>\n"
      "<a class=\"nav\" href=\"2.html\">Two</a>\n"
      "<a\n  href=\"3.html\">Three</a>\n"
      "<link href=\"style.css\">\n"
      "<a href=\"1.html\">One again</a>"
      "</body></html>");
  EXPECT_EQ(links, (std::vector<std::string>{"1.html", "2.html", "3.html",
                                             "1.html"}));
}

TEST(ExtractLinksTest, IgnoresAnchorsWithoutHref) {
  EXPECT_TRUE(ExtractLinks("<a name=\"top\">Top</a><p>text</p>").empty());
}

TEST(ExtractLinksTest, HandlesMegabyteHrefValue) {
  const std::string payload(1 << 20, 'Q');
  auto links = ExtractLinks("<a href=\"data:text/plain;base64," + payload +
                            "\">download</a><a href=\"b.html\">b</a>");
  ASSERT_EQ(links.size(), 2u);
  EXPECT_EQ(links[0].size(), payload.size() + 23);
  EXPECT_EQ(links[1], "b.html");
}

TEST(ExtractLinksTest, HandlesLongAttributeBeforeHref) {
  auto links = ExtractLinks("<a title=\"" + std::string(1 << 20, 'x') +
                            "\" href=\"b.html\">b</a>");
  EXPECT_EQ(links, std::vector<std::string>{"b.html"});
}

TEST(ExtractLinksTest, HrefMustBeInsideTheAnchorTag) {
  EXPECT_TRUE(ExtractLinks("<a name=\"x\">text href=\"b.html\"").empty());
  EXPECT_TRUE(ExtractLinks("<abbr href=\"b.html\">").empty());
  EXPECT_TRUE(ExtractLinks("<a href=\"unterminated").empty());
  EXPECT_EQ(ExtractLinks("<a\thref=\"tab.html\">"),
            std::vector<std::string>{"tab.html"});
}

TEST_F(CrawlerTest, BuildsCorpusFromDirectory) {
  WritePage("1.html", "<a href=\"2.html\">2</a><a href=\"3.html\">3</a>");
  WritePage("2.html", "<a href=\"3.html\">3</a><a href=\"3.html\">again</a>");
  WritePage("3.html", "<p>No links here</p>");

  auto corpus = CrawlCorpus(dir_.string());
  Corpus expected{{"1.html", {"2.html", "3.html"}},
                  {"2.html", {"3.html"}},
                  {"3.html", {}}};
  EXPECT_EQ(corpus, expected);
  EXPECT_NO_THROW(ValidateCorpus(corpus));
}

TEST_F(CrawlerTest, DropsSelfReferencesAndExternalLinks) {
  WritePage("a.html", "<a href=\"a.html\">me</a>"
                      "<a href=\"https://example.com\">out</a>"
                      "<a href=\"missing.html\">gone</a>"
                      "<a href=\"b.html\">b</a>");
  WritePage("b.html", "<a href=\"a.html\">a</a>");

  auto corpus = CrawlCorpus(dir_.string());
  EXPECT_EQ(corpus["a.html"], std::set<Page>{"b.html"});
  EXPECT_EQ(corpus["b.html"], std::set<Page>{"a.html"});
  EXPECT_NO_THROW(ValidateCorpus(corpus));
}

TEST_F(CrawlerTest, SkipsNonHtmlFiles) {
  WritePage("index.html", "<a href=\"notes.txt\">notes</a>");
  WritePage("notes.txt", "<a href=\"index.html\">index</a>");
  fs::create_directory(dir_ / "nested.html");

  auto corpus = CrawlCorpus(dir_.string());
  ASSERT_EQ(corpus.size(), 1u);
  EXPECT_TRUE(corpus["index.html"].empty());
}

TEST_F(CrawlerTest, EmptyDirectoryGivesEmptyCorpus) {
  EXPECT_TRUE(CrawlCorpus(dir_.string()).empty());
}

TEST_F(CrawlerTest, MissingDirectoryIsAnError) {
  EXPECT_THROW(CrawlCorpus((dir_ / "does_not_exist").string()), CrawlError);
}

TEST_F(CrawlerTest, RegularFileIsNotADirectory) {
  WritePage("1.html", "");
  EXPECT_THROW(CrawlCorpus((dir_ / "1.html").string()), CrawlError);
}

} // namespace
} // namespace page_rank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
