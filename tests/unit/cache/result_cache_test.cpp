#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "mocks_test.hpp"
#include "scribe_core/cache/result_cache.hpp"
#include "utilities_test.hpp"

namespace scribe_tests {

using namespace scribe_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

class ResultCacheTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    now_ = ResultCache::Clock::time_point(std::chrono::hours(1000));
  }

  ResultCache::ClockFn clock() {
    return [this] { return now_; };
  }

  void advance(std::chrono::seconds by) {
    now_ += by;
  }

  static std::vector<SearchResult> online_results(const std::string &text) {
    SearchResult result;
    result.score = 0.0f;
    result.source = ResultSource::Online;
    result.text = text;
    result.attribution = "Wikipedia: " + text;
    return {result};
  }

  ResultCache::Clock::time_point now_;
};

TEST_F(ResultCacheTest, ZeroCapacityIsRejected) {
  EXPECT_THROW(ResultCache(CacheConfig{std::chrono::seconds(10), 0}), std::invalid_argument);
}

TEST_F(ResultCacheTest, MissThenHit) {
  ResultCache cache(CacheConfig{}, nullptr, clock());

  EXPECT_FALSE(cache.get("k").has_value());
  cache.put("k", online_results("Volcano"));

  auto entry = cache.get("k");
  ASSERT_TRUE(entry.has_value());
  ASSERT_EQ(entry->results.size(), 1u);
  EXPECT_EQ(entry->results[0].text, "Volcano");
  EXPECT_EQ(entry->fetched_at, now_);
}

TEST_F(ResultCacheTest, EntriesExpireAfterTtl) {
  ResultCache cache(CacheConfig{std::chrono::seconds(60), 8}, nullptr, clock());
  cache.put("k", online_results("Glacier"));

  advance(std::chrono::seconds(59));
  EXPECT_TRUE(cache.get("k").has_value());

  advance(std::chrono::seconds(1));
  EXPECT_FALSE(cache.get("k").has_value());
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResultCacheTest, EvictsLeastRecentlyUsed) {
  ResultCache cache(CacheConfig{std::chrono::seconds(600), 2}, nullptr, clock());
  cache.put("a", online_results("A"));
  cache.put("b", online_results("B"));

  // Touch a so b becomes the eviction candidate
  ASSERT_TRUE(cache.get("a").has_value());
  cache.put("c", online_results("C"));

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_TRUE(cache.get("a").has_value());
  EXPECT_FALSE(cache.get("b").has_value());
  EXPECT_TRUE(cache.get("c").has_value());
}

TEST_F(ResultCacheTest, PutReplacesExistingEntry) {
  ResultCache cache(CacheConfig{}, nullptr, clock());
  cache.put("k", online_results("Old"));
  advance(std::chrono::seconds(5));
  cache.put("k", online_results("New"));

  auto entry = cache.get("k");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->results[0].text, "New");
  EXPECT_EQ(entry->fetched_at, now_);
  EXPECT_EQ(cache.size(), 1u);
}

TEST_F(ResultCacheTest, SurvivesRestartThroughJsonStore) {
  auto path = temp_dir_ / "cache.json";
  {
    ResultCache cache(CacheConfig{}, std::make_shared<JsonFileCacheStore>(path), clock());
    cache.put("first", online_results("Nebula"));
    cache.put("second", online_results("Quasar"));
  }

  ResultCache reloaded(CacheConfig{}, std::make_shared<JsonFileCacheStore>(path), clock());

  EXPECT_EQ(reloaded.size(), 2u);
  auto entry = reloaded.get("second");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->results[0].text, "Quasar");
  EXPECT_EQ(entry->results[0].source, ResultSource::Online);
  EXPECT_EQ(entry->results[0].attribution, "Wikipedia: Quasar");
}

TEST_F(ResultCacheTest, ReloadPreservesRecencyOrder) {
  auto path = temp_dir_ / "cache.json";
  {
    ResultCache cache(CacheConfig{std::chrono::seconds(600), 3},
                      std::make_shared<JsonFileCacheStore>(path), clock());
    cache.put("a", online_results("A"));
    cache.put("b", online_results("B"));
    cache.put("c", online_results("C"));
    ASSERT_TRUE(cache.get("a").has_value());
    // Persisted on the next put, so a is now most recent and b oldest
    cache.put("c", online_results("C2"));
  }

  ResultCache reloaded(CacheConfig{std::chrono::seconds(600), 3},
                       std::make_shared<JsonFileCacheStore>(path), clock());
  reloaded.put("d", online_results("D"));

  EXPECT_FALSE(reloaded.get("b").has_value());
  EXPECT_TRUE(reloaded.get("a").has_value());
}

TEST_F(ResultCacheTest, ExpiredEntriesAreDroppedOnReload) {
  auto path = temp_dir_ / "cache.json";
  {
    ResultCache cache(CacheConfig{std::chrono::seconds(30), 8},
                      std::make_shared<JsonFileCacheStore>(path), clock());
    cache.put("k", online_results("Comet"));
  }
  advance(std::chrono::seconds(31));

  ResultCache reloaded(CacheConfig{std::chrono::seconds(30), 8},
                       std::make_shared<JsonFileCacheStore>(path), clock());
  EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(ResultCacheTest, CorruptFileStartsEmptyAndIsRemoved) {
  auto path = temp_dir_ / "cache.json";
  TestUtilities::write_file(path, "{ this is not json");

  ResultCache cache(CacheConfig{}, std::make_shared<JsonFileCacheStore>(path), clock());

  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(std::filesystem::exists(path));

  cache.put("k", online_results("Aurora"));
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ResultCacheTest, StoreFailureDoesNotFailPut) {
  auto store = std::make_shared<StrictMock<MockCacheStore>>();
  EXPECT_CALL(*store, load()).WillOnce(Return(std::vector<CacheEntry>{}));
  EXPECT_CALL(*store, save(_)).WillOnce(Throw(CacheStoreError("disk full")));

  ResultCache cache(CacheConfig{}, store, clock());
  EXPECT_NO_THROW(cache.put("k", online_results("Tide")));
  EXPECT_TRUE(cache.get("k").has_value());
}

TEST_F(ResultCacheTest, CorruptStoreIsErased) {
  auto store = std::make_shared<StrictMock<MockCacheStore>>();
  EXPECT_CALL(*store, load()).WillOnce(Throw(CacheCorruptionError("bad bytes")));
  EXPECT_CALL(*store, erase_all()).Times(1);

  ResultCache cache(CacheConfig{}, store, clock());
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResultCacheTest, ClearErasesStore) {
  auto store = std::make_shared<NiceMock<MockCacheStore>>();
  EXPECT_CALL(*store, erase_all()).Times(1);

  ResultCache cache(CacheConfig{}, store, clock());
  cache.put("k", online_results("Reef"));
  cache.clear();

  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.get("k").has_value());
}

TEST_F(ResultCacheTest, NonUtf8TextIsPersistedWithReplacement) {
  auto path = temp_dir_ / "cache.json";
  {
    ResultCache cache(CacheConfig{}, std::make_shared<JsonFileCacheStore>(path), clock());
    // "caf\xe9" is Latin-1, not UTF-8
    EXPECT_NO_THROW(cache.put("k", online_results("caf\xe9 latin-1 text")));
    auto entry = cache.get("k");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->results[0].text, "caf\xe9 latin-1 text");
  }

  ResultCache reloaded(CacheConfig{}, std::make_shared<JsonFileCacheStore>(path), clock());

  auto entry = reloaded.get("k");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->results[0].text, std::string("caf") + "\xEF\xBF\xBD" + " latin-1 text");
}

TEST_F(ResultCacheTest, ConcurrentGetAndPutStayWithinCapacity) {
  constexpr size_t kCapacity = 16;
  constexpr int kThreads = 8;
  constexpr int kOpsPerThread = 500;
  ResultCache cache(CacheConfig{std::chrono::seconds(600), kCapacity});

  std::atomic<int> mismatches{0};
  std::atomic<int> hits{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kOpsPerThread; ++i) {
        // Keys are shared between threads so puts and gets contend
        const std::string key = "topic-" + std::to_string((t + i) % 40);
        if (i % 3 == 0) {
          cache.put(key, online_results(key));
        } else if (auto entry = cache.get(key)) {
          ++hits;
          if (entry->query_key != key || entry->results.size() != 1 ||
              entry->results[0].text != key) {
            ++mismatches;
          }
        }
        if (cache.size() > kCapacity) {
          ++mismatches;
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(mismatches.load(), 0);
  EXPECT_GT(hits.load(), 0);
  EXPECT_LE(cache.size(), kCapacity);
}

}  // namespace scribe_tests
