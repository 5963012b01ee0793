#include <atomic>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "scribe_api/config.hpp"
#include "scribe_api/routes.hpp"
#include "scribe_api/server.hpp"
#include "scribe_api/suggestion_store.hpp"
#include "scribe_core/cache/cache_store.hpp"
#include "scribe_core/cache/result_cache.hpp"
#include "scribe_core/index/chunk_index.hpp"
#include "scribe_core/llm/ollama_client.hpp"
#include "scribe_core/online/wikipedia_search_client.hpp"
#include "scribe_core/retrieval/retrieval_orchestrator.hpp"
#include "scribe_core/services/document_loader.hpp"
#include "scribe_core/services/indexing_service.hpp"
#include "scribe_core/suggestion/suggestion_pipeline.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

// Restores the persisted index, or rebuilds it from the documents folder when
// the file is missing or fails its integrity checks.
void load_or_rebuild(scribe_core::ChunkIndex &index,
                     scribe_core::IndexingService &indexing_service,
                     const scribe_api::Config &config) {
  try {
    index.load(config.index_path);
    return;
  } catch (const scribe_core::IndexStoreError &e) {
    std::cout << "[Index] No saved index (" << e.what() << "), building from documents"
              << std::endl;
  } catch (const scribe_core::CorruptIndexError &e) {
    std::cerr << "[Index] Saved index is corrupt (" << e.what() << "), rebuilding" << std::endl;
  }

  try {
    scribe_core::DocumentLoader loader(config.recursive_documents);
    indexing_service.index_folder(config.documents_folder, loader);
    index.persist(config.index_path);
  } catch (const scribe_core::IngestionError &e) {
    std::cerr << "[Index] Could not read documents folder: " << e.what() << std::endl;
  } catch (const scribe_core::EmbeddingUnavailableError &e) {
    std::cerr << "[Index] Embeddings unavailable, starting with an empty index: " << e.what()
              << std::endl;
  }
}

}  // namespace

int main(int argc, char **argv) {
  try {
    const std::string config_path = argc > 1 ? argv[1] : "scribe.json";
    scribe_api::Config config = scribe_api::Config::from_file(config_path);

    std::cout << "Starting Scribe API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Documents Folder: " << config.documents_folder << std::endl;
    std::cout << "Index Path: " << config.index_path << " (" << config.index_backend << ")"
              << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Online Fallback Enabled: " << (config.online_enabled ? "Yes" : "No")
              << std::endl;

    // Initialize core components
    auto ollama_client = std::make_shared<scribe_core::OllamaClient>(config.ollama_settings());
    auto index = std::make_shared<scribe_core::ChunkIndex>(
        config.backend(), static_cast<size_t>(config.embedding_dimension));
    auto indexing_service = std::make_shared<scribe_core::IndexingService>(
        index, ollama_client, config.chunker_config());

    load_or_rebuild(*index, *indexing_service, config);

    auto cache_store = std::make_shared<scribe_core::JsonFileCacheStore>(config.cache_path);
    auto cache = std::make_shared<scribe_core::ResultCache>(config.cache_config(), cache_store);
    std::shared_ptr<scribe_core::OnlineSearchGateway> online;
    if (config.online_enabled) {
      online = std::make_shared<scribe_core::WikipediaSearchClient>();
    }
    auto orchestrator = std::make_shared<scribe_core::RetrievalOrchestrator>(
        config.retrieval_config(), index, cache, online);

    std::shared_ptr<scribe_core::GenerationGateway> generator;
    if (config.generation_enabled) {
      generator = ollama_client;
    }
    auto suggestion_store = std::make_shared<scribe_api::SuggestionStore>();
    auto pipeline = std::make_shared<scribe_core::SuggestionPipeline>(
        config.pipeline_config(), ollama_client, orchestrator, generator,
        [suggestion_store](const scribe_core::SuggestionOutcome &outcome) {
          suggestion_store->record(outcome);
        });

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    scribe_api::Server server(host, port);

    scribe_api::RouteSettings route_settings;
    route_settings.documents_folder = config.documents_folder;
    route_settings.recursive_documents = config.recursive_documents;
    route_settings.index_path = config.index_path;
    route_settings.max_context_chars = static_cast<size_t>(config.max_context_chars);
    scribe_api::Routes routes(indexing_service, index, ollama_client, orchestrator, pipeline,
                              suggestion_store, route_settings);
    routes.register_routes(server);

    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/3] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/3] Stopping suggestion pipeline..." << std::endl;
    pipeline->shutdown();

    std::cout << "[3/3] Persisting index..." << std::endl;
    try {
      index->persist(config.index_path);
    } catch (const scribe_core::IndexStoreError &e) {
      std::cerr << "Failed to persist index: " << e.what() << std::endl;
      return 1;
    }

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
