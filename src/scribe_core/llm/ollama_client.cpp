#include "scribe_core/llm/ollama_client.hpp"

#include <algorithm>
#include <iterator>

#include "ollama.hpp"

namespace scribe_core {

namespace {

constexpr float kVariantTemperatures[] = {0.5f, 0.7f, 0.9f};

}  // namespace

OllamaClient::OllamaClient(OllamaSettings settings) : settings_(std::move(settings)) {
  ollama::setServerURL(settings_.url);
}

std::vector<float> OllamaClient::embed(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(settings_.embedding_model, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailableError("Response does not contain embedding field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingUnavailableError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailableError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailableError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<std::string> OllamaClient::generate(const std::string &prompt, size_t variant_count) {
  std::vector<std::string> completions;
  constexpr size_t kTemperatureCount = std::size(kVariantTemperatures);

  for (size_t i = 0; i < variant_count; ++i) {
    ollama::options options;
    options["temperature"] = kVariantTemperatures[i % kTemperatureCount];
    options["num_predict"] = settings_.max_tokens;

    std::string text;
    try {
      ollama::response response = ollama::generate(settings_.generation_model, prompt, options);
      text = response.as_simple_string();
    } catch (const ollama::exception &e) {
      throw GenerationError("Generation failed: " + std::string(e.what()));
    }

    if (text.empty() ||
        std::find(completions.begin(), completions.end(), text) != completions.end()) {
      continue;
    }
    completions.push_back(std::move(text));
  }
  return completions;
}

bool OllamaClient::is_available() {
  return ollama::is_running();
}

}  // namespace scribe_core
