#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "scribe_core/suggestion/prompt_builder.hpp"

namespace scribe_tests {

using namespace scribe_core;
using ::testing::HasSubstr;
using ::testing::Not;

namespace {

SearchResult result_with_text(const std::string &text) {
  SearchResult result;
  result.text = text;
  result.attribution = "notes.md";
  return result;
}

}  // namespace

TEST(PromptBuilderTest, ContextJoinsResultsWithSeparator) {
  auto context = PromptBuilder::build_context(
      {result_with_text("Alpha."), result_with_text("Beta.")}, 1000);
  EXPECT_EQ(context, "Alpha.\n\n---\n\nBeta.");
}

TEST(PromptBuilderTest, ContextDropsSmallRemainder) {
  const std::string first(200, 'a');
  const std::string second(200, 'b');

  auto context =
      PromptBuilder::build_context({result_with_text(first), result_with_text(second)}, 250);

  EXPECT_EQ(context, first);
}

TEST(PromptBuilderTest, ContextTruncatesLargeRemainderAndStops) {
  const std::string first(200, 'a');
  const std::string second(200, 'b');
  const std::string third(10, 'c');

  auto context = PromptBuilder::build_context(
      {result_with_text(first), result_with_text(second), result_with_text(third)}, 350);

  EXPECT_EQ(context, first + "\n\n---\n\n" + std::string(150, 'b'));
}

TEST(PromptBuilderTest, EmptyResultsGiveEmptyContext) {
  EXPECT_EQ(PromptBuilder::build_context({}, 2000), "");
}

TEST(PromptBuilderTest, PromptListsAtMostThreeReferences) {
  std::vector<SearchResult> results;
  for (int i = 0; i < 5; ++i) {
    results.push_back(result_with_text("Fact number " + std::to_string(i)));
  }

  auto prompt = PromptBuilder::build_prompt("The study of stars", results);

  EXPECT_THAT(prompt, HasSubstr("Reference 1: Fact number 0"));
  EXPECT_THAT(prompt, HasSubstr("Reference 3: Fact number 2"));
  EXPECT_THAT(prompt, Not(HasSubstr("Reference 4")));
  EXPECT_THAT(prompt, HasSubstr("The study of stars"));
}

TEST(PromptBuilderTest, PromptClipsLongReferences) {
  auto prompt = PromptBuilder::build_prompt("x", {result_with_text(std::string(500, 'z'))});

  EXPECT_THAT(prompt, HasSubstr(std::string(300, 'z')));
  EXPECT_THAT(prompt, Not(HasSubstr(std::string(301, 'z'))));
}

TEST(PromptBuilderTest, PromptWithoutReferencesAsksForPlainContinuation) {
  auto prompt = PromptBuilder::build_prompt("Once upon a time", {});

  EXPECT_THAT(prompt, HasSubstr("Complete the following text naturally"));
  EXPECT_THAT(prompt, Not(HasSubstr("Reference")));
}

TEST(PromptBuilderTest, CleanStripsQuotesAndKeepsTwoSentences) {
  auto cleaned = PromptBuilder::clean_completion(
      "  \"Cells divide. They grow. They die.\"  ", "Biology notes");
  EXPECT_EQ(cleaned, "Cells divide. They grow.");
}

TEST(PromptBuilderTest, CleanDropsEchoedUserText) {
  auto cleaned = PromptBuilder::clean_completion("I think that cells divide.", "I think");
  EXPECT_EQ(cleaned, "that cells divide.");
}

TEST(PromptBuilderTest, CleanCutsLongOutputAtWordBoundary) {
  std::string raw;
  for (int i = 0; i < 120; ++i) {
    raw += "word ";
  }

  auto cleaned = PromptBuilder::clean_completion(raw, "");

  EXPECT_LE(cleaned.size(), 403u);
  EXPECT_EQ(cleaned.substr(cleaned.size() - 3), "...");
  EXPECT_EQ(cleaned.substr(cleaned.size() - 7, 4), "word");
}

TEST(PromptBuilderTest, CleanOfBlankOutputIsEmpty) {
  EXPECT_EQ(PromptBuilder::clean_completion("   \"\"  ", "abc"), "");
}

}  // namespace scribe_tests
