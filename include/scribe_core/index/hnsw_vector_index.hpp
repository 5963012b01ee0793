#pragma once
#include <faiss/IndexHNSW.h>
#include <faiss/IndexIDMap.h>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "scribe_core/index/vector_index.hpp"

namespace scribe_core {

/**
 * @class HnswVectorIndex
 * @brief Approximate backend built on a Faiss HNSW graph.
 *
 * Vectors are unit-normalized and searched by inner product, which equals
 * cosine similarity. HNSW graphs do not support deletion, so removals mark
 * the graph stale and it is rebuilt from the retained vectors on the next
 * search.
 */
class HnswVectorIndex : public VectorIndex {
 public:
  explicit HnswVectorIndex(size_t dimension);
  ~HnswVectorIndex() override;

  HnswVectorIndex(const HnswVectorIndex &) = delete;
  HnswVectorIndex &operator=(const HnswVectorIndex &) = delete;

  void add(ChunkId chunk_id, const std::vector<float> &vector) override;
  void remove(ChunkId chunk_id) override;
  std::vector<ScoredChunk> search(const std::vector<float> &query, size_t k) const override;
  void bulk_load(std::vector<IndexedVector> entries) override;
  std::vector<IndexedVector> entries() const override;

  bool contains(ChunkId chunk_id) const override {
    return vectors_.count(chunk_id) > 0;
  }
  size_t size() const override {
    return vectors_.size();
  }
  size_t dimension() const override {
    return dimension_;
  }
  void clear() override;
  std::string backend_name() const override {
    return "hnsw";
  }

 private:
  // Faiss Index Parameters
  const int HNSW_M_PARAM = 32;
  const int HNSW_EF_CONSTRUCTION_PARAM = 100;
  const int HNSW_EF_SEARCH_PARAM = 64;
  // Extra candidates requested so ties at the cut-off can be re-ordered
  const size_t TIE_MARGIN = 8;

  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  void rebuild_locked() const;

  size_t dimension_;
  std::map<ChunkId, std::vector<float>> vectors_;

  // The graph is a cache of vectors_; search() may rebuild it.
  mutable std::mutex faiss_mu_;
  mutable std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  mutable bool stale_ = false;
};

}  // namespace scribe_core
