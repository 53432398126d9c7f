// tests/validator_test.cc
#include "page_rank/errors.hh"
#include "page_rank/validator.hh"

#include <gtest/gtest.h>

namespace page_rank {
namespace {

TEST(ValidatorTest, AcceptsWellFormedCorpus) {
  Corpus corpus{{"A", {"B", "C"}}, {"B", {}}, {"C", {"A"}}};
  EXPECT_NO_THROW(ValidateCorpus(corpus));
}

TEST(ValidatorTest, AcceptsEmptyCorpus) { EXPECT_NO_THROW(ValidateCorpus({})); }

TEST(ValidatorTest, RejectsSelfLoop) {
  Corpus corpus{{"A", {"A", "B"}}, {"B", {"A"}}};
  EXPECT_THROW(ValidateCorpus(corpus), CorpusError);
}

TEST(ValidatorTest, RejectsDanglingLink) {
  Corpus corpus{{"A", {"B"}}, {"B", {"missing.html"}}};
  try {
    ValidateCorpus(corpus);
    FAIL() << "Expected CorpusError";
  } catch (const CorpusError &e) {
    EXPECT_NE(std::string(e.what()).find("missing.html"), std::string::npos);
  }
}

TEST(ValidatorTest, RejectsEmptyPageIdentifier) {
  Corpus corpus{{"", {}}, {"A", {}}};
  EXPECT_THROW(ValidateCorpus(corpus), CorpusError);
}

TEST(ValidatorTest, RejectsEmptyLinkTarget) {
  Corpus corpus{{"A", {""}}};
  EXPECT_THROW(ValidateCorpus(corpus), CorpusError);
}

TEST(ValidatorTest, DoesNotRepairInvalidCorpus) {
  Corpus corpus{{"A", {"A", "Z"}}};
  const Corpus before = corpus;
  EXPECT_THROW(ValidateCorpus(corpus), CorpusError);
  EXPECT_EQ(corpus, before);
}

} // namespace
} // namespace page_rank

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
