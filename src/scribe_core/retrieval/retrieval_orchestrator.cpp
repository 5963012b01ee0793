#include "scribe_core/retrieval/retrieval_orchestrator.hpp"

#include <iostream>
#include <stdexcept>

#include "scribe_core/cache/query_key.hpp"

namespace scribe_core {

RetrievalOrchestrator::RetrievalOrchestrator(RetrievalConfig config,
                                             std::shared_ptr<ChunkIndex> index,
                                             std::shared_ptr<ResultCache> cache,
                                             std::shared_ptr<OnlineSearchGateway> online)
    : config_(config),
      index_(std::move(index)),
      cache_(std::move(cache)),
      online_(std::move(online)) {
  if (!index_) {
    throw std::invalid_argument("RetrievalOrchestrator requires a chunk index");
  }
}

RetrievalOutcome RetrievalOrchestrator::retrieve(const std::string &query_text,
                                                 const std::vector<float> &query_embedding) const {
  return retrieve(query_text, query_embedding, config_.similarity_threshold, config_.top_k);
}

RetrievalOutcome RetrievalOrchestrator::retrieve(const std::string &query_text,
                                                 const std::vector<float> &query_embedding,
                                                 float similarity_threshold,
                                                 size_t top_k) const {
  RetrievalOutcome outcome;
  if (top_k == 0) {
    return outcome;
  }

  std::vector<SearchResult> local = index_->search(query_embedding, top_k);

  if (!local.empty() && local.front().score >= similarity_threshold) {
    outcome.results = std::move(local);
    log_outcome(query_text, outcome);
    return outcome;
  }

  outcome.fallback_triggered = true;
  if (config_.keep_sub_threshold_local) {
    outcome.results = std::move(local);
  }

  std::vector<SearchResult> online = fetch_online(query_text, outcome);
  for (auto &result : online) {
    if (outcome.results.size() >= top_k) {
      break;
    }
    outcome.results.push_back(std::move(result));
  }

  log_outcome(query_text, outcome);
  return outcome;
}

std::vector<SearchResult> RetrievalOrchestrator::fetch_online(const std::string &query_text,
                                                              RetrievalOutcome &outcome) const {
  if (!config_.online_enabled || !online_) {
    return {};
  }

  const std::string key = make_query_key(query_text);
  if (cache_) {
    if (auto entry = cache_->get(key)) {
      outcome.cache_hit = true;
      return entry->results;
    }
  }

  std::vector<OnlineHit> hits;
  try {
    hits = online_->search(query_text, config_.max_online_results, config_.online_timeout);
  } catch (const std::exception &e) {
    std::cerr << "[Retrieval] Online fallback failed, continuing local-only: " << e.what()
              << std::endl;
    outcome.online_failed = true;
    return {};
  }

  std::vector<SearchResult> results;
  for (auto &hit : hits) {
    if (results.size() >= config_.max_online_results) {
      break;
    }
    SearchResult result;
    result.chunk_id = kNoChunk;
    result.score = hit.score;
    result.source = ResultSource::Online;
    result.text = std::move(hit.text);
    result.attribution = std::move(hit.attribution);
    results.push_back(std::move(result));
  }

  if (cache_ && !results.empty()) {
    cache_->put(key, results);
  }
  return results;
}

void RetrievalOrchestrator::log_outcome(const std::string &query_text,
                                        const RetrievalOutcome &outcome) const {
  std::cout << "[Retrieval] query=\"" << query_text << "\" results=" << outcome.results.size()
            << " fallback=" << (outcome.fallback_triggered ? "yes" : "no");
  if (outcome.fallback_triggered) {
    std::cout << " cache_hit=" << (outcome.cache_hit ? "yes" : "no")
              << " online_failed=" << (outcome.online_failed ? "yes" : "no");
  }
  std::cout << std::endl;

  for (const auto &result : outcome.results) {
    std::cout << "[Retrieval]   " << to_string(result.source) << " score=" << result.score;
    if (result.source == ResultSource::Local) {
      std::cout << " chunk=" << result.chunk_id;
    }
    std::cout << " from " << result.attribution << std::endl;
  }
}

}  // namespace scribe_core
