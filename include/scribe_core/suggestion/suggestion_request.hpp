#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "scribe_core/suggestion/suggestion_types.hpp"

namespace scribe_core {

// One querySuggestions call. Shared between the pipeline, its scheduler and
// the worker running it; the flag and state are the only mutable parts.
struct SuggestionRequest {
  SuggestionRequest(RequestId id, std::string context, size_t cursor)
      : request_id(id), context_text(std::move(context)), cursor_position(cursor) {}

  const RequestId request_id;
  const std::string context_text;
  const size_t cursor_position;

  std::atomic<bool> cancelled{false};
  std::atomic<SuggestionState> state{SuggestionState::Debouncing};
  std::chrono::steady_clock::time_point fire_at;

  bool is_cancelled() const {
    return cancelled.load();
  }

  // Text before the cursor, clamped to the context length.
  std::string text_before_cursor() const {
    return context_text.substr(0, std::min(cursor_position, context_text.size()));
  }
};

using SuggestionRequestPtr = std::shared_ptr<SuggestionRequest>;

}  // namespace scribe_core
