#include "scribe_core/suggestion/suggestion_types.hpp"

namespace scribe_core {

std::string to_string(SuggestionState state) {
  switch (state) {
    case SuggestionState::Idle:
      return "idle";
    case SuggestionState::Debouncing:
      return "debouncing";
    case SuggestionState::Retrieving:
      return "retrieving";
    case SuggestionState::Generating:
      return "generating";
    case SuggestionState::Completed:
      return "completed";
    case SuggestionState::Cancelled:
      return "cancelled";
    case SuggestionState::Failed:
      return "failed";
    default:
      return "unknown";
  }
}

bool is_terminal(SuggestionState state) {
  return state == SuggestionState::Idle || state == SuggestionState::Completed ||
         state == SuggestionState::Cancelled || state == SuggestionState::Failed;
}

std::string to_string(SuggestionOrigin origin) {
  switch (origin) {
    case SuggestionOrigin::Generated:
      return "generated";
    case SuggestionOrigin::Template:
      return "template";
    default:
      return "unknown";
  }
}

}  // namespace scribe_core
