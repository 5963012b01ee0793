#include <gtest/gtest.h>

#include "scribe_core/cache/query_key.hpp"

namespace scribe_tests {

using namespace scribe_core;

TEST(QueryKeyTest, NormalizeLowercasesTrimsAndCollapses) {
  EXPECT_EQ(normalize_query("  Quantum   Computing\t\nBasics  "), "quantum computing basics");
  EXPECT_EQ(normalize_query(""), "");
  EXPECT_EQ(normalize_query("   "), "");
}

TEST(QueryKeyTest, KeyIsSha256OfNormalizedQuery) {
  EXPECT_EQ(make_query_key("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(make_query_key("  ABC "), make_query_key("abc"));
}

TEST(QueryKeyTest, DistinctQueriesGetDistinctKeys) {
  EXPECT_NE(make_query_key("black holes"), make_query_key("white holes"));
  EXPECT_EQ(make_query_key("black holes").size(), 64u);
}

}  // namespace scribe_tests
