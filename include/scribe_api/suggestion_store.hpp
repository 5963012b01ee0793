#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "scribe_core/suggestion/suggestion_types.hpp"

namespace scribe_api {

// Delivered suggestion outcomes kept for polling clients. Oldest entries are
// dropped beyond the capacity.
class SuggestionStore {
 public:
  explicit SuggestionStore(size_t capacity = 64) : capacity_(capacity) {}

  void record(const scribe_core::SuggestionOutcome &outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcomes_.find(outcome.request_id) == outcomes_.end()) {
      order_.push_back(outcome.request_id);
    }
    outcomes_[outcome.request_id] = outcome;
    while (order_.size() > capacity_) {
      outcomes_.erase(order_.front());
      order_.pop_front();
    }
  }

  std::optional<scribe_core::SuggestionOutcome> find(scribe_core::RequestId request_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outcomes_.find(request_id);
    if (it == outcomes_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

 private:
  size_t capacity_;
  mutable std::mutex mutex_;
  std::unordered_map<scribe_core::RequestId, scribe_core::SuggestionOutcome> outcomes_;
  std::deque<scribe_core::RequestId> order_;
};

}  // namespace scribe_api
