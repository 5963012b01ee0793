#pragma once

#include <string>
#include <vector>

#include "scribe_core/types/search_result.hpp"

namespace scribe_core {

/**
 * @brief Turns retrieved results and the user's text into generation input,
 * and generation output back into a usable suggestion.
 */
class PromptBuilder {
 public:
  static constexpr size_t MAX_REFERENCES = 3;
  static constexpr size_t MAX_REFERENCE_CHARS = 300;
  static constexpr size_t MIN_PARTIAL_CHARS = 100;
  static constexpr const char *CONTEXT_SEPARATOR = "\n\n---\n\n";

  /**
   * @brief Joins result texts in order until max_context_chars is reached.
   *
   * A result that does not fit whole is cut to the remaining budget only if
   * more than MIN_PARTIAL_CHARS remain; either way it is the last one used.
   */
  static std::string build_context(const std::vector<SearchResult> &results,
                                   size_t max_context_chars);

  // Reference-materials prompt over the top results, or a bare continuation
  // prompt when there are none.
  static std::string build_prompt(const std::string &user_text,
                                  const std::vector<SearchResult> &results);

  /**
   * @brief Normalizes a raw completion.
   *
   * Strips surrounding quotes, drops an echoed copy of the user's text, keeps
   * at most two sentences and cuts at a word boundary beyond max_chars.
   * @return Empty if nothing usable remains.
   */
  static std::string clean_completion(const std::string &raw,
                                      const std::string &user_text,
                                      size_t max_chars = 400);
};

}  // namespace scribe_core
