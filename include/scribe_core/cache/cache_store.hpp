#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "scribe_core/types/search_result.hpp"

namespace scribe_core {

// The persisted cache could not be parsed. The cache starts empty instead.
class CacheCorruptionError : public std::exception {
 public:
  explicit CacheCorruptionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CacheStoreError : public std::exception {
 public:
  explicit CacheStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct CacheEntry {
  std::string query_key;
  std::vector<SearchResult> results;
  std::chrono::system_clock::time_point fetched_at;
  std::chrono::seconds ttl{0};
};

/**
 * @brief Durable key-value backing for ResultCache.
 *
 * Entries are exchanged in least-recently-used-first order so a reload
 * restores the recency ordering.
 */
class CacheStore {
 public:
  virtual ~CacheStore() = default;

  // @return empty if nothing has been saved yet.
  // @throws CacheCorruptionError if saved data cannot be parsed.
  virtual std::vector<CacheEntry> load() = 0;

  // @throws CacheStoreError
  virtual void save(const std::vector<CacheEntry> &entries) = 0;

  virtual void erase_all() = 0;
};

class JsonFileCacheStore : public CacheStore {
 public:
  static constexpr int FORMAT_VERSION = 1;

  explicit JsonFileCacheStore(std::filesystem::path path);

  std::vector<CacheEntry> load() override;
  void save(const std::vector<CacheEntry> &entries) override;
  void erase_all() override;

  const std::filesystem::path &path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

}  // namespace scribe_core
