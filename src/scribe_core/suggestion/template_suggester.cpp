#include "scribe_core/suggestion/template_suggester.hpp"

#include <algorithm>

#include "scribe_core/suggestion/text_utils.hpp"

namespace scribe_core {

namespace {

std::string with_terminator(std::string sentence) {
  if (!sentence.empty()) {
    char last = sentence.back();
    if (last != '.' && last != '!' && last != '?') {
      sentence += '.';
    }
  }
  return sentence;
}

}  // namespace

std::vector<Suggestion> TemplateSuggester::suggest(const std::string &context_text,
                                                   const std::vector<SearchResult> &results,
                                                   size_t count) const {
  std::vector<Suggestion> suggestions;
  const std::string context_lower = text::to_lower(context_text);

  for (const auto &result : results) {
    if (suggestions.size() >= count) {
      break;
    }
    if (text::trim(result.text).empty()) {
      continue;
    }

    std::string candidate = continuation_of(context_text, result.text);
    if (candidate.empty()) {
      candidate = opening_of(result.text);
    }
    if (candidate.empty() || context_lower.find(text::to_lower(candidate)) != std::string::npos) {
      continue;
    }

    auto duplicate = std::find_if(suggestions.begin(), suggestions.end(),
                                  [&](const Suggestion &s) { return s.text == candidate; });
    if (duplicate != suggestions.end()) {
      continue;
    }

    Suggestion suggestion;
    suggestion.text = std::move(candidate);
    suggestion.origin = SuggestionOrigin::Template;
    if (!result.attribution.empty()) {
      suggestion.attributions.push_back(result.attribution);
    }
    suggestions.push_back(std::move(suggestion));
  }
  return suggestions;
}

std::string TemplateSuggester::continuation_of(const std::string &context_text,
                                               const std::string &text) const {
  const std::string tail = text::last_words(context_text, MATCH_WORDS);
  if (tail.empty()) {
    return "";
  }
  const size_t at = text::to_lower(text).find(text::to_lower(tail));
  if (at == std::string::npos) {
    return "";
  }
  std::vector<std::string> sentences = text::split_sentences(text.substr(at + tail.size()));
  if (sentences.empty()) {
    return "";
  }
  return with_terminator(text::truncate_utf8(sentences.front(), MAX_CHARS));
}

std::string TemplateSuggester::opening_of(const std::string &text) const {
  std::vector<std::string> sentences = text::split_sentences(text);
  std::string opening;
  for (size_t i = 0; i < sentences.size() && i < MAX_SENTENCES; ++i) {
    const size_t joined = opening.empty() ? sentences[i].size() : opening.size() + 1 + sentences[i].size();
    if (joined > MAX_CHARS) {
      break;
    }
    if (!opening.empty()) {
      opening += ' ';
    }
    opening += sentences[i];
  }

  if (opening.empty() && !sentences.empty()) {
    // A single sentence longer than the cap is cut at a word boundary.
    std::string cut = text::truncate_utf8(sentences.front(), MAX_CHARS);
    size_t space = cut.find_last_of(' ');
    if (space != std::string::npos && space > 0) {
      cut.resize(space);
    }
    return cut + "...";
  }
  return with_terminator(opening);
}

}  // namespace scribe_core
