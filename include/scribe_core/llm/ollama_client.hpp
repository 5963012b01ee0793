#pragma once

#include <string>
#include <vector>

#include "scribe_core/gateways/embedding_gateway.hpp"
#include "scribe_core/gateways/generation_gateway.hpp"

namespace scribe_core {

struct OllamaSettings {
  std::string url = "http://localhost:11434";
  std::string embedding_model = "mxbai-embed-large";
  std::string generation_model = "llama3.2";
  int max_tokens = 100;
};

/**
 * @class OllamaClient
 * @brief Embedding and generation gateways backed by an Ollama server.
 *
 * Construction does not require the server to be running; calls made while
 * it is down raise EmbeddingUnavailableError or GenerationError.
 */
class OllamaClient : public EmbeddingGateway, public GenerationGateway {
 public:
  explicit OllamaClient(OllamaSettings settings);

  std::vector<float> embed(const std::string &text) override;

  // Variant i is sampled at temperature 0.5, 0.7, 0.9, repeating.
  // Empty and duplicate completions are dropped.
  std::vector<std::string> generate(const std::string &prompt, size_t variant_count) override;

  bool is_available() override;

 private:
  OllamaSettings settings_;
};

}  // namespace scribe_core
