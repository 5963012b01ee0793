#pragma once

#include <gmock/gmock.h>

#include <chrono>
#include <string>
#include <vector>

#include "scribe_core/cache/cache_store.hpp"
#include "scribe_core/gateways/embedding_gateway.hpp"
#include "scribe_core/gateways/generation_gateway.hpp"
#include "scribe_core/gateways/online_search_gateway.hpp"

namespace scribe_tests {

class MockEmbeddingGateway : public scribe_core::EmbeddingGateway {
 public:
  MOCK_METHOD(std::vector<float>, embed, (const std::string &text), (override));
};

class MockOnlineSearchGateway : public scribe_core::OnlineSearchGateway {
 public:
  MOCK_METHOD(std::vector<scribe_core::OnlineHit>,
              search,
              (const std::string &query, size_t max_results, std::chrono::milliseconds timeout),
              (override));
};

class MockGenerationGateway : public scribe_core::GenerationGateway {
 public:
  MockGenerationGateway() {
    ON_CALL(*this, is_available()).WillByDefault(testing::Return(true));
  }

  MOCK_METHOD(std::vector<std::string>,
              generate,
              (const std::string &prompt, size_t variant_count),
              (override));
  MOCK_METHOD(bool, is_available, (), (override));
};

class MockCacheStore : public scribe_core::CacheStore {
 public:
  MOCK_METHOD(std::vector<scribe_core::CacheEntry>, load, (), (override));
  MOCK_METHOD(void, save, (const std::vector<scribe_core::CacheEntry> &entries), (override));
  MOCK_METHOD(void, erase_all, (), (override));
};

}  // namespace scribe_tests
