#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "scribe_api/server.hpp"
#include "scribe_api/suggestion_store.hpp"

namespace scribe_core {
class ChunkIndex;
class EmbeddingGateway;
class IndexingService;
class RetrievalOrchestrator;
class SuggestionPipeline;
struct SearchResult;
}  // namespace scribe_core

namespace scribe_api {

struct RouteSettings {
  std::string documents_folder;
  bool recursive_documents = false;
  std::string index_path;
  size_t max_context_chars = 1500;
};

class Routes {
 public:
  Routes(std::shared_ptr<scribe_core::IndexingService> indexing_service,
         std::shared_ptr<scribe_core::ChunkIndex> index,
         std::shared_ptr<scribe_core::EmbeddingGateway> embedder,
         std::shared_ptr<scribe_core::RetrievalOrchestrator> orchestrator,
         std::shared_ptr<scribe_core::SuggestionPipeline> pipeline,
         std::shared_ptr<SuggestionStore> suggestion_store,
         RouteSettings settings);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  std::shared_ptr<scribe_core::IndexingService> indexing_service_;
  std::shared_ptr<scribe_core::ChunkIndex> index_;
  std::shared_ptr<scribe_core::EmbeddingGateway> embedder_;
  std::shared_ptr<scribe_core::RetrievalOrchestrator> orchestrator_;
  std::shared_ptr<scribe_core::SuggestionPipeline> pipeline_;
  std::shared_ptr<SuggestionStore> suggestion_store_;
  RouteSettings settings_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_index_document(const crow::request &req);
  crow::response handle_delete_document(const crow::request &req, const std::string &document_id);
  crow::response handle_reindex(const crow::request &req);
  crow::response handle_submit_suggestion(const crow::request &req);
  crow::response handle_get_suggestion(const crow::request &req, uint64_t request_id);
  crow::response handle_cancel_suggestion(const crow::request &req, uint64_t request_id);
  crow::response handle_search(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json result_to_json(const scribe_core::SearchResult &result);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace scribe_api
