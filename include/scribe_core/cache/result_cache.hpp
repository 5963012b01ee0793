#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scribe_core/cache/cache_store.hpp"
#include "scribe_core/types/search_result.hpp"

namespace scribe_core {

struct CacheConfig {
  std::chrono::seconds ttl{86400};
  size_t capacity = 256;
};

/**
 * @class ResultCache
 * @brief TTL-bounded LRU cache of online search results keyed by query key.
 *
 * Entries are served only while younger than their ttl; expired entries are
 * evicted when touched. When a CacheStore is attached its contents are loaded
 * at construction and rewritten after every put.
 */
class ResultCache {
 public:
  using Clock = std::chrono::system_clock;
  using ClockFn = std::function<Clock::time_point()>;

  explicit ResultCache(CacheConfig config,
                       std::shared_ptr<CacheStore> store = nullptr,
                       ClockFn clock = nullptr);

  std::optional<CacheEntry> get(const std::string &query_key);

  void put(const std::string &query_key, std::vector<SearchResult> results);

  // Drops every entry and the persisted copy.
  void clear();

  size_t size() const;

 private:
  using EntryList = std::list<CacheEntry>;

  void restore();
  void persist_locked();
  void evict_overflow_locked();
  bool expired(const CacheEntry &entry, Clock::time_point now) const;

  CacheConfig config_;
  std::shared_ptr<CacheStore> store_;
  ClockFn clock_;

  mutable std::mutex mutex_;
  // Most recently used at the front.
  EntryList entries_;
  std::unordered_map<std::string, EntryList::iterator> lookup_;
};

}  // namespace scribe_core
