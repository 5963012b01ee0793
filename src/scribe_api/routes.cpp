#include "scribe_api/routes.hpp"

#include <iostream>

#include "scribe_core/gateways/embedding_gateway.hpp"
#include "scribe_core/index/chunk_index.hpp"
#include "scribe_core/retrieval/retrieval_orchestrator.hpp"
#include "scribe_core/services/document_loader.hpp"
#include "scribe_core/services/indexing_service.hpp"
#include "scribe_core/suggestion/prompt_builder.hpp"
#include "scribe_core/suggestion/suggestion_pipeline.hpp"
#include "scribe_core/types.hpp"

namespace scribe_api {

namespace {

nlohmann::json report_to_json(const scribe_core::IndexingReport &report) {
  return {{"indexed", report.indexed},
          {"skipped", report.skipped},
          {"chunks", report.chunks},
          {"failures", report.failures}};
}

}  // namespace

Routes::Routes(std::shared_ptr<scribe_core::IndexingService> indexing_service,
               std::shared_ptr<scribe_core::ChunkIndex> index,
               std::shared_ptr<scribe_core::EmbeddingGateway> embedder,
               std::shared_ptr<scribe_core::RetrievalOrchestrator> orchestrator,
               std::shared_ptr<scribe_core::SuggestionPipeline> pipeline,
               std::shared_ptr<SuggestionStore> suggestion_store,
               RouteSettings settings)
    : indexing_service_(std::move(indexing_service)),
      index_(std::move(index)),
      embedder_(std::move(embedder)),
      orchestrator_(std::move(orchestrator)),
      pipeline_(std::move(pipeline)),
      suggestion_store_(std::move(suggestion_store)),
      settings_(std::move(settings)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_index_document(req);
  });

  CROW_ROUTE(app, "/documents/reindex")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
        return handle_reindex(req);
      });

  CROW_ROUTE(app, "/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_delete_document(req, document_id);
          });

  CROW_ROUTE(app, "/suggestions")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
        return handle_submit_suggestion(req);
      });

  CROW_ROUTE(app, "/suggestions/<uint>")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req, uint64_t request_id) {
        return handle_get_suggestion(req, request_id);
      });

  CROW_ROUTE(app, "/suggestions/<uint>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, uint64_t request_id) {
        return handle_cancel_suggestion(req, request_id);
      });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  std::cout << "[Api] All routes registered" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &) {
  nlohmann::json response = create_success_response("Scribe API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  response["index"] = {{"chunks", index_->size()},
                       {"documents", index_->document_count()},
                       {"backend", index_->backend_name()},
                       {"dimension", index_->dimension()}};
  return create_json_response(response);
}

crow::response Routes::handle_index_document(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    scribe_core::Document document;

    if (body.contains("path")) {
      scribe_core::DocumentLoader loader(settings_.recursive_documents);
      document = loader.load(body.at("path").get<std::string>(), body.value("document_id", ""));
    } else {
      document.document_id = body.value("document_id", "");
      document.raw_text = body.value("text", "");
    }

    std::cout << "[Api] Indexing document: " << document.document_id << std::endl;
    size_t chunks = indexing_service_->index_document(document);

    nlohmann::json response = create_success_response(
        "Document indexed", {{"document_id", document.document_id}, {"chunks", chunks}});
    return create_json_response(response);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()),
                                400);
  } catch (const scribe_core::IngestionError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const scribe_core::EmbeddingUnavailableError &e) {
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "[Api] Exception in handle_index_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_document(const crow::request &,
                                              const std::string &document_id) {
  try {
    size_t removed = indexing_service_->remove_document(document_id);
    if (removed == 0) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    nlohmann::json response = create_success_response(
        "Document removed", {{"document_id", document_id}, {"chunks", removed}});
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "[Api] Exception in handle_delete_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_reindex(const crow::request &) {
  try {
    scribe_core::DocumentLoader loader(settings_.recursive_documents);
    index_->clear();
    scribe_core::IndexingReport report =
        indexing_service_->index_folder(settings_.documents_folder, loader);
    index_->persist(settings_.index_path);

    return create_json_response(create_success_response("Reindex complete", report_to_json(report)));
  } catch (const scribe_core::IngestionError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const scribe_core::EmbeddingUnavailableError &e) {
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "[Api] Exception in handle_reindex: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_submit_suggestion(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string text = body.value("text", "");
    const size_t cursor = body.value("cursor", text.size());

    scribe_core::RequestId request_id = pipeline_->submit(text, cursor);
    nlohmann::json response =
        create_success_response("Suggestion request accepted", {{"request_id", request_id}});
    return create_json_response(response, 202);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()),
                                400);
  } catch (const std::exception &e) {
    std::cerr << "[Api] Exception in handle_submit_suggestion: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_suggestion(const crow::request &, uint64_t request_id) {
  auto state = pipeline_->state(request_id);
  if (!state) {
    return create_json_response(create_error_response("Suggestion request not found"), 404);
  }

  nlohmann::json data;
  data["request_id"] = request_id;
  data["state"] = scribe_core::to_string(*state);
  data["latest"] = pipeline_->latest_request_id() == request_id;
  data["suggestions"] = nlohmann::json::array();

  if (auto outcome = suggestion_store_->find(request_id)) {
    for (const auto &suggestion : outcome->suggestions) {
      data["suggestions"].push_back({{"text", suggestion.text},
                                     {"origin", scribe_core::to_string(suggestion.origin)},
                                     {"attributions", suggestion.attributions}});
    }
    nlohmann::json references = nlohmann::json::array();
    for (const auto &reference : outcome->references) {
      references.push_back(result_to_json(reference));
    }
    data["references"] = references;
    data["query"] = outcome->query;
    data["fallback_triggered"] = outcome->fallback_triggered;
    if (!outcome->error.empty()) {
      data["error"] = outcome->error;
    }
  }

  return create_json_response(create_success_response("Suggestion state", data));
}

crow::response Routes::handle_cancel_suggestion(const crow::request &, uint64_t request_id) {
  if (!pipeline_->state(request_id)) {
    return create_json_response(create_error_response("Suggestion request not found"), 404);
  }
  bool cancelled = pipeline_->cancel(request_id);
  nlohmann::json response = create_success_response(
      cancelled ? "Suggestion request cancelled" : "Suggestion request already finished",
      {{"request_id", request_id}, {"cancelled", cancelled}});
  return create_json_response(response);
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    const std::string query = body.value("query", "");
    if (query.empty()) {
      return create_json_response(create_error_response("query cannot be empty"), 400);
    }
    const int top_k = body.value("top_k", static_cast<int>(orchestrator_->config().top_k));
    if (top_k <= 0) {
      return create_json_response(create_error_response("top_k must be greater than 0"), 400);
    }

    std::cout << "[Api] Search for: " << query << " with top_k: " << top_k << std::endl;
    std::vector<float> embedding = embedder_->embed(query);
    scribe_core::RetrievalOutcome outcome = orchestrator_->retrieve(
        query, embedding, orchestrator_->config().similarity_threshold, static_cast<size_t>(top_k));

    nlohmann::json results = nlohmann::json::array();
    for (const auto &result : outcome.results) {
      results.push_back(result_to_json(result));
    }

    nlohmann::json data;
    data["results"] = results;
    data["context"] =
        scribe_core::PromptBuilder::build_context(outcome.results, settings_.max_context_chars);
    data["fallback_triggered"] = outcome.fallback_triggered;
    data["cache_hit"] = outcome.cache_hit;
    data["online_failed"] = outcome.online_failed;
    return create_json_response(create_success_response("Search complete", data));
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()),
                                400);
  } catch (const scribe_core::EmbeddingUnavailableError &e) {
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "[Api] Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

nlohmann::json Routes::result_to_json(const scribe_core::SearchResult &result) {
  return {{"chunk_id", result.chunk_id},
          {"score", result.score},
          {"source", scribe_core::to_string(result.source)},
          {"text", result.text},
          {"attribution", result.attribution}};
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response response(status_code, json_data.dump());
  response.set_header("Content-Type", "application/json");
  return response;
}

}  // namespace scribe_api
