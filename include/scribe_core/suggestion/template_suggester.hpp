#pragma once

#include <string>
#include <vector>

#include "scribe_core/suggestion/suggestion_types.hpp"
#include "scribe_core/types/search_result.hpp"

namespace scribe_core {

/**
 * @class TemplateSuggester
 * @brief Builds suggestions straight from retrieved text when no generation
 * model is available.
 *
 * If the last words the user typed occur in a result, the sentence that
 * continues them is suggested. Otherwise the result's opening sentences
 * are. Suggestions the user has already written are skipped.
 */
class TemplateSuggester {
 public:
  static constexpr size_t MAX_SENTENCES = 3;
  static constexpr size_t MAX_CHARS = 400;
  static constexpr size_t MATCH_WORDS = 5;

  std::vector<Suggestion> suggest(const std::string &context_text,
                                  const std::vector<SearchResult> &results,
                                  size_t count) const;

 private:
  std::string continuation_of(const std::string &context_text, const std::string &text) const;
  std::string opening_of(const std::string &text) const;
};

}  // namespace scribe_core
