#include "scribe_core/suggestion/suggestion_pipeline.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "scribe_core/suggestion/prompt_builder.hpp"
#include "scribe_core/suggestion/text_utils.hpp"

namespace scribe_core {

SuggestionPipeline::SuggestionPipeline(PipelineConfig config,
                                       std::shared_ptr<EmbeddingGateway> embedder,
                                       std::shared_ptr<RetrievalOrchestrator> orchestrator,
                                       std::shared_ptr<GenerationGateway> generator,
                                       Callback callback)
    : config_(config),
      embedder_(std::move(embedder)),
      orchestrator_(std::move(orchestrator)),
      generator_(std::move(generator)),
      callback_(std::move(callback)) {
  if (!embedder_ || !orchestrator_) {
    throw std::invalid_argument("SuggestionPipeline requires an embedder and an orchestrator");
  }
  pool_ = std::make_unique<async::WorkerPool>(std::max<size_t>(config_.num_workers, 1));
  pool_->start();
  scheduler_ = std::thread(&SuggestionPipeline::scheduler_loop, this);
}

SuggestionPipeline::~SuggestionPipeline() {
  shutdown();
}

RequestId SuggestionPipeline::submit(const std::string &context_text, size_t cursor_position) {
  std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopping_) {
    throw std::runtime_error("SuggestionPipeline has been shut down");
  }

  if (latest_ && cancel_request(latest_)) {
    std::cout << "[Pipeline] Request " << latest_->request_id << " superseded" << std::endl;
  }

  auto request = std::make_shared<SuggestionRequest>(++next_id_, context_text, cursor_position);
  request->fire_at = std::chrono::steady_clock::now() + config_.debounce;
  pending_ = request;
  latest_ = request;
  remember_locked(request);

  cv_.notify_all();
  return request->request_id;
}

bool SuggestionPipeline::cancel(RequestId request_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = history_.find(request_id);
  if (it == history_.end()) {
    return false;
  }
  bool cancelled = cancel_request(it->second);
  if (pending_ == it->second) {
    pending_.reset();
    cv_.notify_all();
  }
  if (cancelled) {
    std::cout << "[Pipeline] Request " << request_id << " cancelled" << std::endl;
  }
  return cancelled;
}

std::optional<SuggestionState> SuggestionPipeline::state(RequestId request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = history_.find(request_id);
  if (it == history_.end()) {
    return std::nullopt;
  }
  return it->second->state.load();
}

RequestId SuggestionPipeline::latest_request_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_ ? latest_->request_id : 0;
}

void SuggestionPipeline::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    if (latest_) {
      cancel_request(latest_);
    }
    pending_.reset();
  }
  cv_.notify_all();

  if (scheduler_.joinable()) {
    scheduler_.join();
  }
  if (pool_) {
    pool_->stop();
  }
  std::cout << "[Pipeline] Shut down" << std::endl;
}

void SuggestionPipeline::scheduler_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (!pending_) {
      cv_.wait(lock, [this] { return stopping_ || pending_ != nullptr; });
      continue;
    }

    SuggestionRequestPtr request = pending_;
    const bool interrupted = cv_.wait_until(lock, request->fire_at, [this, &request] {
      return stopping_ || pending_ != request;
    });
    if (interrupted) {
      continue;
    }

    pending_.reset();
    lock.unlock();
    dispatch(request);
    lock.lock();
  }
}

void SuggestionPipeline::dispatch(const SuggestionRequestPtr &request) {
  if (request->is_cancelled()) {
    return;
  }

  std::string query =
      text::extract_query(request->text_before_cursor(), config_.context_window_chars);
  if (query.size() < config_.min_trigger_chars) {
    if (advance(request, SuggestionState::Debouncing, SuggestionState::Idle)) {
      std::cout << "[Pipeline] Request " << request->request_id
                << " below trigger length, back to idle" << std::endl;
    }
    return;
  }

  if (!advance(request, SuggestionState::Debouncing, SuggestionState::Retrieving)) {
    return;
  }

  bool queued = pool_->submit([this, request, query] { run_request(request, query); });
  if (!queued) {
    advance(request, SuggestionState::Retrieving, SuggestionState::Cancelled);
  }
}

void SuggestionPipeline::run_request(const SuggestionRequestPtr &request,
                                     const std::string &query) {
  SuggestionOutcome outcome;
  outcome.request_id = request->request_id;
  outcome.query = query;

  try {
    if (request->is_cancelled()) {
      return;
    }
    std::vector<float> embedding = embedder_->embed(query);

    if (request->is_cancelled()) {
      return;
    }
    RetrievalOutcome retrieval = orchestrator_->retrieve(query, embedding);
    outcome.references = std::move(retrieval.results);
    outcome.fallback_triggered = retrieval.fallback_triggered;

    if (request->is_cancelled() ||
        !advance(request, SuggestionState::Retrieving, SuggestionState::Generating)) {
      return;
    }
    outcome.suggestions = build_suggestions(request, outcome.references);

    if (request->is_cancelled() ||
        !advance(request, SuggestionState::Generating, SuggestionState::Completed)) {
      return;
    }
    outcome.state = SuggestionState::Completed;
    std::cout << "[Pipeline] Request " << request->request_id << " completed with "
              << outcome.suggestions.size() << " suggestions" << std::endl;
  } catch (const std::exception &e) {
    SuggestionState current = request->state.load();
    if (is_terminal(current) ||
        !request->state.compare_exchange_strong(current, SuggestionState::Failed)) {
      return;
    }
    outcome.state = SuggestionState::Failed;
    outcome.error = e.what();
    outcome.suggestions.clear();
    std::cerr << "[Pipeline] Request " << request->request_id << " failed: " << e.what()
              << std::endl;
  }

  deliver(request, outcome);
}

std::vector<Suggestion> SuggestionPipeline::build_suggestions(
    const SuggestionRequestPtr &request, const std::vector<SearchResult> &references) {
  const std::string user_text = request->text_before_cursor();
  std::vector<Suggestion> suggestions;

  std::vector<std::string> attributions;
  for (size_t i = 0; i < references.size() && i < PromptBuilder::MAX_REFERENCES; ++i) {
    if (!references[i].attribution.empty()) {
      attributions.push_back(references[i].attribution);
    }
  }

  if (generator_ && generator_->is_available()) {
    try {
      const std::string prompt = PromptBuilder::build_prompt(user_text, references);
      for (const auto &raw : generator_->generate(prompt, config_.suggestion_count)) {
        std::string cleaned = PromptBuilder::clean_completion(raw, user_text);
        if (cleaned.empty()) {
          continue;
        }
        auto duplicate = std::find_if(suggestions.begin(), suggestions.end(),
                                      [&](const Suggestion &s) { return s.text == cleaned; });
        if (duplicate != suggestions.end()) {
          continue;
        }
        suggestions.push_back({std::move(cleaned), SuggestionOrigin::Generated, attributions});
      }
    } catch (const GenerationError &e) {
      std::cerr << "[Pipeline] Generation failed, using templates: " << e.what() << std::endl;
    }
  }

  if (request->is_cancelled() || suggestions.size() >= config_.suggestion_count) {
    return suggestions;
  }

  for (auto &fallback :
       template_suggester_.suggest(user_text, references, config_.suggestion_count)) {
    if (suggestions.size() >= config_.suggestion_count) {
      break;
    }
    auto duplicate = std::find_if(suggestions.begin(), suggestions.end(),
                                  [&](const Suggestion &s) { return s.text == fallback.text; });
    if (duplicate == suggestions.end()) {
      suggestions.push_back(std::move(fallback));
    }
  }
  return suggestions;
}

void SuggestionPipeline::deliver(const SuggestionRequestPtr &request,
                                 const SuggestionOutcome &outcome) {
  std::lock_guard<std::mutex> delivery_lock(delivery_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (latest_ != request || request->is_cancelled()) {
      return;
    }
  }
  if (callback_) {
    callback_(outcome);
  }
}

bool SuggestionPipeline::advance(const SuggestionRequestPtr &request,
                                 SuggestionState from,
                                 SuggestionState to) {
  return request->state.compare_exchange_strong(from, to);
}

bool SuggestionPipeline::cancel_request(const SuggestionRequestPtr &request) {
  request->cancelled.store(true);
  SuggestionState current = request->state.load();
  while (!is_terminal(current)) {
    if (request->state.compare_exchange_weak(current, SuggestionState::Cancelled)) {
      return true;
    }
  }
  return false;
}

void SuggestionPipeline::remember_locked(const SuggestionRequestPtr &request) {
  history_[request->request_id] = request;
  history_order_.push_back(request->request_id);
  while (history_order_.size() > std::max<size_t>(config_.history_limit, 1)) {
    history_.erase(history_order_.front());
    history_order_.pop_front();
  }
}

}  // namespace scribe_core
