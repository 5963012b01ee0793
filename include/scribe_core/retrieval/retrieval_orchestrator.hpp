#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "scribe_core/cache/result_cache.hpp"
#include "scribe_core/gateways/online_search_gateway.hpp"
#include "scribe_core/index/chunk_index.hpp"
#include "scribe_core/types/search_result.hpp"

namespace scribe_core {

struct RetrievalConfig {
  float similarity_threshold = 0.3f;
  size_t top_k = 5;
  bool online_enabled = true;
  size_t max_online_results = 3;
  std::chrono::milliseconds online_timeout{3000};
  // When fallback fires, keep the local results that missed the threshold
  // ahead of the online ones.
  bool keep_sub_threshold_local = false;
};

struct RetrievalOutcome {
  std::vector<SearchResult> results;
  bool fallback_triggered = false;
  bool cache_hit = false;
  bool online_failed = false;
};

/**
 * @class RetrievalOrchestrator
 * @brief Local-first retrieval with thresholded online fallback.
 *
 * Local results are returned as-is when the best one reaches the similarity
 * threshold. Otherwise the online gateway is consulted through the result
 * cache. Online failures degrade to local-only and never fail a retrieval.
 * Local results always precede online ones.
 */
class RetrievalOrchestrator {
 public:
  RetrievalOrchestrator(RetrievalConfig config,
                        std::shared_ptr<ChunkIndex> index,
                        std::shared_ptr<ResultCache> cache,
                        std::shared_ptr<OnlineSearchGateway> online);

  RetrievalOutcome retrieve(const std::string &query_text,
                            const std::vector<float> &query_embedding) const;

  // Same as above with a per-call threshold and result count.
  RetrievalOutcome retrieve(const std::string &query_text,
                            const std::vector<float> &query_embedding,
                            float similarity_threshold,
                            size_t top_k) const;

  const RetrievalConfig &config() const {
    return config_;
  }

 private:
  std::vector<SearchResult> fetch_online(const std::string &query_text,
                                         RetrievalOutcome &outcome) const;
  void log_outcome(const std::string &query_text, const RetrievalOutcome &outcome) const;

  RetrievalConfig config_;
  std::shared_ptr<ChunkIndex> index_;
  std::shared_ptr<ResultCache> cache_;
  std::shared_ptr<OnlineSearchGateway> online_;
};

}  // namespace scribe_core
