#pragma once

#include <string>
#include <vector>

namespace scribe_core::text {

std::string trim(const std::string &value);
std::string to_lower(const std::string &value);

// Cuts to at most max_bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string &value, size_t max_bytes);

// Sentences ending in '.', '!' or '?' followed by whitespace or end of text,
// trimmed. A trailing fragment without a terminator is kept as-is.
std::vector<std::string> split_sentences(const std::string &value);

// The last max_words whitespace-separated words joined by single spaces.
std::string last_words(const std::string &value, size_t max_words);

/**
 * @brief Derives the retrieval query from the text before the cursor.
 *
 * Keeps the last window_chars bytes, trims them, and reduces the result to
 * the text after the last sentence break or newline when that text is not
 * empty.
 */
std::string extract_query(const std::string &text_before_cursor, size_t window_chars);

}  // namespace scribe_core::text
