#include "scribe_core/suggestion/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace scribe_core::text {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_terminator(char c) {
  return c == '.' || c == '!' || c == '?';
}

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::string trim(const std::string &value) {
  size_t start = 0;
  while (start < value.size() && is_space(value[start])) {
    ++start;
  }
  size_t end = value.size();
  while (end > start && is_space(value[end - 1])) {
    --end;
  }
  return value.substr(start, end - start);
}

std::string to_lower(const std::string &value) {
  std::string out = value;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string truncate_utf8(const std::string &value, size_t max_bytes) {
  if (value.size() <= max_bytes) {
    return value;
  }
  size_t cut = max_bytes;
  while (cut > 0 && is_continuation_byte(value[cut])) {
    --cut;
  }
  return value.substr(0, cut);
}

std::vector<std::string> split_sentences(const std::string &value) {
  std::vector<std::string> sentences;
  size_t start = 0;
  for (size_t i = 0; i < value.size(); ++i) {
    if (!is_terminator(value[i])) {
      continue;
    }
    if (i + 1 < value.size() && !is_space(value[i + 1])) {
      continue;
    }
    std::string sentence = trim(value.substr(start, i + 1 - start));
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
    start = i + 1;
  }
  if (start < value.size()) {
    std::string tail = trim(value.substr(start));
    if (!tail.empty()) {
      sentences.push_back(std::move(tail));
    }
  }
  return sentences;
}

std::string last_words(const std::string &value, size_t max_words) {
  std::istringstream stream(value);
  std::vector<std::string> words;
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  size_t first = words.size() > max_words ? words.size() - max_words : 0;
  std::string out;
  for (size_t i = first; i < words.size(); ++i) {
    if (!out.empty()) {
      out += ' ';
    }
    out += words[i];
  }
  return out;
}

std::string extract_query(const std::string &text_before_cursor, size_t window_chars) {
  std::string window = text_before_cursor;
  if (window.size() > window_chars) {
    size_t cut = window.size() - window_chars;
    while (cut < window.size() && is_continuation_byte(window[cut])) {
      ++cut;
    }
    window = window.substr(cut);
  }
  std::string query = trim(window);

  size_t boundary = std::string::npos;
  for (size_t i = 0; i < query.size(); ++i) {
    if (query[i] == '\n' ||
        (is_terminator(query[i]) && i + 1 < query.size() && is_space(query[i + 1]))) {
      boundary = i;
    }
  }
  if (boundary != std::string::npos) {
    std::string last = trim(query.substr(boundary + 1));
    if (!last.empty()) {
      return last;
    }
  }
  return query;
}

}  // namespace scribe_core::text
