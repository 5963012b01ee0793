#include <gtest/gtest.h>

#include "scribe_api/suggestion_store.hpp"

namespace scribe_tests {

using scribe_api::SuggestionStore;
using scribe_core::SuggestionOutcome;
using scribe_core::SuggestionState;

namespace {

SuggestionOutcome outcome_for(scribe_core::RequestId id, SuggestionState state) {
  SuggestionOutcome outcome;
  outcome.request_id = id;
  outcome.state = state;
  return outcome;
}

}  // namespace

TEST(SuggestionStoreTest, FindsRecordedOutcome) {
  SuggestionStore store;
  store.record(outcome_for(4, SuggestionState::Completed));

  auto found = store.find(4);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->state, SuggestionState::Completed);
  EXPECT_FALSE(store.find(5).has_value());
}

TEST(SuggestionStoreTest, RecordingAgainReplaces) {
  SuggestionStore store;
  store.record(outcome_for(1, SuggestionState::Failed));
  store.record(outcome_for(1, SuggestionState::Completed));

  EXPECT_EQ(store.find(1)->state, SuggestionState::Completed);
}

TEST(SuggestionStoreTest, DropsOldestBeyondCapacity) {
  SuggestionStore store(2);
  store.record(outcome_for(1, SuggestionState::Completed));
  store.record(outcome_for(2, SuggestionState::Completed));
  store.record(outcome_for(3, SuggestionState::Completed));

  EXPECT_FALSE(store.find(1).has_value());
  EXPECT_TRUE(store.find(2).has_value());
  EXPECT_TRUE(store.find(3).has_value());
}

}  // namespace scribe_tests
