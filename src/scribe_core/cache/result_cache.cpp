#include "scribe_core/cache/result_cache.hpp"

#include <iostream>
#include <stdexcept>

namespace scribe_core {

ResultCache::ResultCache(CacheConfig config, std::shared_ptr<CacheStore> store, ClockFn clock)
    : config_(config), store_(std::move(store)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return Clock::now(); };
  }
  if (config_.capacity == 0) {
    throw std::invalid_argument("Cache capacity must be greater than zero");
  }
  restore();
}

bool ResultCache::expired(const CacheEntry &entry, Clock::time_point now) const {
  return now - entry.fetched_at >= entry.ttl;
}

void ResultCache::restore() {
  if (!store_) {
    return;
  }

  std::vector<CacheEntry> saved;
  try {
    saved = store_->load();
  } catch (const CacheCorruptionError &e) {
    std::cerr << "[Cache] Discarding corrupt cache: " << e.what() << std::endl;
    store_->erase_all();
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = clock_();
  size_t dropped = 0;
  for (auto &entry : saved) {
    if (expired(entry, now)) {
      ++dropped;
      continue;
    }
    auto existing = lookup_.find(entry.query_key);
    if (existing != lookup_.end()) {
      entries_.erase(existing->second);
    }
    entries_.push_front(std::move(entry));
    lookup_[entries_.front().query_key] = entries_.begin();
  }
  evict_overflow_locked();

  std::cout << "[Cache] Restored " << entries_.size() << " entries (" << dropped << " expired)"
            << std::endl;
}

std::optional<CacheEntry> ResultCache::get(const std::string &query_key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lookup_.find(query_key);
  if (it == lookup_.end()) {
    return std::nullopt;
  }

  if (expired(*it->second, clock_())) {
    entries_.erase(it->second);
    lookup_.erase(it);
    return std::nullopt;
  }

  entries_.splice(entries_.begin(), entries_, it->second);
  return entries_.front();
}

void ResultCache::put(const std::string &query_key, std::vector<SearchResult> results) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = lookup_.find(query_key);
  if (it != lookup_.end()) {
    entries_.erase(it->second);
    lookup_.erase(it);
  }

  CacheEntry entry;
  entry.query_key = query_key;
  entry.results = std::move(results);
  entry.fetched_at = clock_();
  entry.ttl = config_.ttl;
  entries_.push_front(std::move(entry));
  lookup_[query_key] = entries_.begin();

  evict_overflow_locked();
  persist_locked();
}

void ResultCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  lookup_.clear();
  if (store_) {
    store_->erase_all();
  }
}

size_t ResultCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

void ResultCache::evict_overflow_locked() {
  while (entries_.size() > config_.capacity) {
    lookup_.erase(entries_.back().query_key);
    entries_.pop_back();
  }
}

void ResultCache::persist_locked() {
  if (!store_) {
    return;
  }
  std::vector<CacheEntry> ordered(entries_.rbegin(), entries_.rend());
  try {
    store_->save(ordered);
  } catch (const CacheStoreError &e) {
    std::cerr << "[Cache] Failed to persist cache: " << e.what() << std::endl;
  }
}

}  // namespace scribe_core
