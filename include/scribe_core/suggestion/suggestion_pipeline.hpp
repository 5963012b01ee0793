#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>

#include "scribe_core/async/worker_pool.hpp"
#include "scribe_core/gateways/embedding_gateway.hpp"
#include "scribe_core/gateways/generation_gateway.hpp"
#include "scribe_core/retrieval/retrieval_orchestrator.hpp"
#include "scribe_core/suggestion/suggestion_request.hpp"
#include "scribe_core/suggestion/suggestion_types.hpp"
#include "scribe_core/suggestion/template_suggester.hpp"

namespace scribe_core {

struct PipelineConfig {
  std::chrono::milliseconds debounce{500};
  size_t min_trigger_chars = 3;
  size_t context_window_chars = 100;
  size_t suggestion_count = 3;
  size_t num_workers = 1;
  // Finished requests whose state stays queryable.
  size_t history_limit = 64;
};

/**
 * @class SuggestionPipeline
 * @brief Debounced, cancellable suggestion generation.
 *
 * Each submit() supersedes the previous request. A scheduler thread fires
 * the newest request once the debounce interval passes without further
 * input, and a worker pool runs its retrieval and generation stages. The
 * cancellation flag is checked between stages. Only the latest request, if
 * not cancelled, reaches the callback; cancelled requests end silently.
 *
 * Lifecycle: Debouncing -> Retrieving -> Generating -> Completed, with
 * Cancelled or Failed reachable from any non-terminal state and Idle when
 * the query is below the trigger length.
 *
 * The callback runs on a worker thread and must not call submit().
 */
class SuggestionPipeline {
 public:
  using Callback = std::function<void(const SuggestionOutcome &)>;

  SuggestionPipeline(PipelineConfig config,
                     std::shared_ptr<EmbeddingGateway> embedder,
                     std::shared_ptr<RetrievalOrchestrator> orchestrator,
                     std::shared_ptr<GenerationGateway> generator,
                     Callback callback);

  ~SuggestionPipeline();

  SuggestionPipeline(const SuggestionPipeline &) = delete;
  SuggestionPipeline &operator=(const SuggestionPipeline &) = delete;

  // Cancels any unfinished request and starts a new one in Debouncing.
  // @throws std::runtime_error after shutdown().
  RequestId submit(const std::string &context_text, size_t cursor_position);

  // @return false if the request is unknown or already finished.
  bool cancel(RequestId request_id);

  // nullopt for ids never issued or evicted from history.
  std::optional<SuggestionState> state(RequestId request_id) const;

  // 0 before the first submit.
  RequestId latest_request_id() const;

  // Cancels outstanding work and joins all threads. Idempotent.
  void shutdown();

 private:
  void scheduler_loop();
  void dispatch(const SuggestionRequestPtr &request);
  void run_request(const SuggestionRequestPtr &request, const std::string &query);
  std::vector<Suggestion> build_suggestions(const SuggestionRequestPtr &request,
                                            const std::vector<SearchResult> &references);
  void deliver(const SuggestionRequestPtr &request, const SuggestionOutcome &outcome);

  bool advance(const SuggestionRequestPtr &request, SuggestionState from, SuggestionState to);
  bool cancel_request(const SuggestionRequestPtr &request);
  void remember_locked(const SuggestionRequestPtr &request);

  PipelineConfig config_;
  std::shared_ptr<EmbeddingGateway> embedder_;
  std::shared_ptr<RetrievalOrchestrator> orchestrator_;
  std::shared_ptr<GenerationGateway> generator_;
  Callback callback_;
  TemplateSuggester template_suggester_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  SuggestionRequestPtr pending_;
  SuggestionRequestPtr latest_;
  std::unordered_map<RequestId, SuggestionRequestPtr> history_;
  std::deque<RequestId> history_order_;
  RequestId next_id_ = 0;
  bool stopping_ = false;

  // Held across the callback so a superseding submit() waits for it.
  std::mutex delivery_mutex_;

  std::unique_ptr<async::WorkerPool> pool_;
  std::thread scheduler_;
};

}  // namespace scribe_core
