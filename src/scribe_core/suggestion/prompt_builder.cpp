#include "scribe_core/suggestion/prompt_builder.hpp"

#include <algorithm>
#include <sstream>

#include "scribe_core/suggestion/text_utils.hpp"

namespace scribe_core {

std::string PromptBuilder::build_context(const std::vector<SearchResult> &results,
                                         size_t max_context_chars) {
  std::vector<std::string> parts;
  size_t used = 0;
  for (const auto &result : results) {
    if (used + result.text.size() <= max_context_chars) {
      parts.push_back(result.text);
      used += result.text.size();
      continue;
    }
    const size_t remaining = max_context_chars - used;
    if (remaining > MIN_PARTIAL_CHARS) {
      parts.push_back(text::truncate_utf8(result.text, remaining));
    }
    break;
  }

  std::string context;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      context += CONTEXT_SEPARATOR;
    }
    context += parts[i];
  }
  return context;
}

std::string PromptBuilder::build_prompt(const std::string &user_text,
                                        const std::vector<SearchResult> &results) {
  std::ostringstream prompt;
  if (results.empty()) {
    prompt << "Complete the following text naturally:\n\n"
           << user_text << "\n\nContinuation:";
    return prompt.str();
  }

  prompt << "Based on the following reference materials, continue the text naturally and "
            "informatively.\n\nReference Materials:\n";
  const size_t count = std::min(results.size(), MAX_REFERENCES);
  for (size_t i = 0; i < count; ++i) {
    if (i > 0) {
      prompt << "\n\n";
    }
    prompt << "Reference " << (i + 1) << ": "
           << text::truncate_utf8(results[i].text, MAX_REFERENCE_CHARS);
  }
  prompt << "\n\nText to continue:\n" << user_text << "\n\nNatural continuation:";
  return prompt.str();
}

std::string PromptBuilder::clean_completion(const std::string &raw,
                                            const std::string &user_text,
                                            size_t max_chars) {
  std::string completion = text::trim(raw);

  if (completion.size() >= 2 && completion.front() == '"' && completion.back() == '"') {
    completion = text::trim(completion.substr(1, completion.size() - 2));
  }

  const std::string echoed = text::trim(user_text);
  if (!echoed.empty() && completion.compare(0, echoed.size(), echoed) == 0) {
    completion = text::trim(completion.substr(echoed.size()));
  }

  std::vector<std::string> sentences = text::split_sentences(completion);
  if (sentences.size() > 2) {
    completion = sentences[0] + " " + sentences[1];
  }

  if (completion.size() > max_chars) {
    std::string cut = text::truncate_utf8(completion, max_chars);
    size_t space = cut.find_last_of(' ');
    if (space != std::string::npos && space > 0) {
      cut.resize(space);
    }
    completion = cut + "...";
  }
  return completion;
}

}  // namespace scribe_core
