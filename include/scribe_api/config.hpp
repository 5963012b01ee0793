#pragma once

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "scribe_core/cache/result_cache.hpp"
#include "scribe_core/chunking/chunker.hpp"
#include "scribe_core/index/vector_index.hpp"
#include "scribe_core/llm/ollama_client.hpp"
#include "scribe_core/retrieval/retrieval_orchestrator.hpp"
#include "scribe_core/suggestion/suggestion_pipeline.hpp"

namespace scribe_api {

class Config {
 public:
  std::string api_base_url;
  std::string documents_folder;
  bool recursive_documents;
  std::string index_path;
  std::string cache_path;
  std::string index_backend;
  int embedding_dimension;

  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  bool generation_enabled;
  int generation_max_tokens;

  // Chunking
  int chunk_size;
  int chunk_overlap;

  // Retrieval
  double similarity_threshold;
  int top_k;
  bool keep_sub_threshold_local;
  int max_context_chars;

  // Suggestions
  int debounce_ms;
  int min_trigger_chars;
  int context_window_chars;
  int suggestion_count;
  int num_workers;

  // Online fallback and its cache
  bool online_enabled;
  int max_online_results;
  int online_timeout_ms;
  int cache_ttl_seconds;
  int cache_capacity;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.documents_folder =
          json_config.value("documents_folder", std::string("./data/documents"));
      config.recursive_documents = json_config.value("recursive_documents", false);
      config.index_path = json_config.value("index_path", std::string("./data/index.db"));
      config.cache_path = json_config.value("cache_path", std::string("./data/online_cache.json"));
      config.index_backend = json_config.value("index_backend", std::string("flat"));
      config.embedding_dimension = json_config.value("embedding_dimension", 1024);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.generation_enabled = json_config.value("generation_enabled", true);
      config.generation_max_tokens = json_config.value("generation_max_tokens", 100);

      config.chunk_size = json_config.value("chunk_size", 512);
      config.chunk_overlap = json_config.value("chunk_overlap", 50);

      config.similarity_threshold = json_config.value("similarity_threshold", 0.3);
      config.top_k = json_config.value("top_k", 5);
      config.keep_sub_threshold_local = json_config.value("keep_sub_threshold_local", false);
      config.max_context_chars = json_config.value("max_context_chars", 1500);

      config.debounce_ms = json_config.value("debounce_ms", 500);
      config.min_trigger_chars = json_config.value("min_trigger_chars", 3);
      config.context_window_chars = json_config.value("context_window_chars", 100);
      config.suggestion_count = json_config.value("suggestion_count", 3);
      config.num_workers = json_config.value("num_workers", 1);

      config.online_enabled = json_config.value("online_enabled", true);
      config.max_online_results = json_config.value("max_online_results", 3);
      config.online_timeout_ms = json_config.value("online_timeout_ms", 3000);
      config.cache_ttl_seconds = json_config.value("cache_ttl_seconds", 86400);
      config.cache_capacity = json_config.value("cache_capacity", 256);
    } catch (const nlohmann::json::type_error &e) {
      throw std::runtime_error(std::string("Invalid config value type: ") + e.what());
    }

    config.validate();
    return config;
  }

  scribe_core::IndexBackend backend() const {
    return scribe_core::index_backend_from_string(index_backend);
  }

  scribe_core::ChunkerConfig chunker_config() const {
    scribe_core::ChunkerConfig chunker;
    chunker.max_chars = static_cast<size_t>(chunk_size);
    chunker.overlap_chars = static_cast<size_t>(chunk_overlap);
    return chunker;
  }

  scribe_core::RetrievalConfig retrieval_config() const {
    scribe_core::RetrievalConfig retrieval;
    retrieval.similarity_threshold = static_cast<float>(similarity_threshold);
    retrieval.top_k = static_cast<size_t>(top_k);
    retrieval.online_enabled = online_enabled;
    retrieval.max_online_results = static_cast<size_t>(max_online_results);
    retrieval.online_timeout = std::chrono::milliseconds(online_timeout_ms);
    retrieval.keep_sub_threshold_local = keep_sub_threshold_local;
    return retrieval;
  }

  scribe_core::CacheConfig cache_config() const {
    scribe_core::CacheConfig cache;
    cache.ttl = std::chrono::seconds(cache_ttl_seconds);
    cache.capacity = static_cast<size_t>(cache_capacity);
    return cache;
  }

  scribe_core::PipelineConfig pipeline_config() const {
    scribe_core::PipelineConfig pipeline;
    pipeline.debounce = std::chrono::milliseconds(debounce_ms);
    pipeline.min_trigger_chars = static_cast<size_t>(min_trigger_chars);
    pipeline.context_window_chars = static_cast<size_t>(context_window_chars);
    pipeline.suggestion_count = static_cast<size_t>(suggestion_count);
    pipeline.num_workers = static_cast<size_t>(num_workers);
    return pipeline;
  }

  scribe_core::OllamaSettings ollama_settings() const {
    scribe_core::OllamaSettings settings;
    settings.url = ollama_url;
    settings.embedding_model = embedding_model;
    settings.generation_model = generation_model;
    settings.max_tokens = generation_max_tokens;
    return settings;
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (index_path.empty()) {
      throw std::runtime_error("index_path cannot be empty");
    }
    if (cache_path.empty()) {
      throw std::runtime_error("cache_path cannot be empty");
    }
    if (index_backend != "flat" && index_backend != "hnsw") {
      throw std::runtime_error("index_backend must be 'flat' or 'hnsw'");
    }
    if (embedding_dimension <= 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_enabled && generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty when generation_enabled is true");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (similarity_threshold < -1.0 || similarity_threshold > 1.0) {
      throw std::runtime_error("similarity_threshold must be within [-1, 1]");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
    if (max_context_chars <= 0) {
      throw std::runtime_error("max_context_chars must be greater than 0");
    }
    if (debounce_ms < 0) {
      throw std::runtime_error("debounce_ms cannot be negative");
    }
    if (min_trigger_chars < 0) {
      throw std::runtime_error("min_trigger_chars cannot be negative");
    }
    if (context_window_chars <= 0) {
      throw std::runtime_error("context_window_chars must be greater than 0");
    }
    if (suggestion_count <= 0) {
      throw std::runtime_error("suggestion_count must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (max_online_results < 0) {
      throw std::runtime_error("max_online_results cannot be negative");
    }
    if (online_timeout_ms <= 0) {
      throw std::runtime_error("online_timeout_ms must be greater than 0");
    }
    if (cache_ttl_seconds <= 0) {
      throw std::runtime_error("cache_ttl_seconds must be greater than 0");
    }
    if (cache_capacity <= 0) {
      throw std::runtime_error("cache_capacity must be greater than 0");
    }
  }
};

}  // namespace scribe_api
