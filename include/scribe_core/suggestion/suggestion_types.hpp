#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "scribe_core/types/search_result.hpp"

namespace scribe_core {

using RequestId = uint64_t;

enum class SuggestionState { Idle, Debouncing, Retrieving, Generating, Completed, Cancelled, Failed };

std::string to_string(SuggestionState state);

// Completed, Cancelled, Failed and Idle accept no further transitions.
bool is_terminal(SuggestionState state);

enum class SuggestionOrigin { Generated, Template };

std::string to_string(SuggestionOrigin origin);

struct Suggestion {
  std::string text;
  SuggestionOrigin origin = SuggestionOrigin::Template;
  // Attributions of the results the suggestion drew on, local first.
  std::vector<std::string> attributions;
};

struct SuggestionOutcome {
  RequestId request_id = 0;
  SuggestionState state = SuggestionState::Idle;
  std::string query;
  std::vector<Suggestion> suggestions;
  std::vector<SearchResult> references;
  bool fallback_triggered = false;
  std::string error;
};

}  // namespace scribe_core
