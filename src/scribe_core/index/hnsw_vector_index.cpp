#include "scribe_core/index/hnsw_vector_index.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace scribe_core {

HnswVectorIndex::HnswVectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw std::invalid_argument("HnswVectorIndex dimension must be greater than 0");
  }
  faiss_index_ = create_base_index();
}

HnswVectorIndex::~HnswVectorIndex() = default;

std::unique_ptr<faiss::IndexIDMap> HnswVectorIndex::create_base_index() const {
  auto base_index = new faiss::IndexHNSWFlat(static_cast<int>(dimension_), HNSW_M_PARAM,
                                             faiss::METRIC_INNER_PRODUCT);
  base_index->hnsw.efConstruction = HNSW_EF_CONSTRUCTION_PARAM;
  base_index->hnsw.efSearch = HNSW_EF_SEARCH_PARAM;
  // Wrap with IDMap to enable add_with_ids; the map owns the graph
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;
  return index;
}

void HnswVectorIndex::add(ChunkId chunk_id, const std::vector<float> &vector) {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
  std::vector<float> normalized = normalize_vector(vector);

  std::lock_guard<std::mutex> lock(faiss_mu_);
  const bool overwrite = vectors_.count(chunk_id) > 0;
  vectors_[chunk_id] = normalized;
  if (overwrite) {
    // The graph cannot update a node in place
    stale_ = true;
  } else if (!stale_) {
    faiss::idx_t id = static_cast<faiss::idx_t>(chunk_id);
    faiss_index_->add_with_ids(1, normalized.data(), &id);
  }
}

void HnswVectorIndex::remove(ChunkId chunk_id) {
  std::lock_guard<std::mutex> lock(faiss_mu_);
  if (vectors_.erase(chunk_id) > 0) {
    stale_ = true;
  }
}

void HnswVectorIndex::rebuild_locked() const {
  auto index = create_base_index();
  if (!vectors_.empty()) {
    std::vector<faiss::idx_t> faiss_ids;
    std::vector<float> all_vectors_flat;
    faiss_ids.reserve(vectors_.size());
    all_vectors_flat.reserve(vectors_.size() * dimension_);
    for (const auto &[id, vec] : vectors_) {
      faiss_ids.push_back(static_cast<faiss::idx_t>(id));
      all_vectors_flat.insert(all_vectors_flat.end(), vec.begin(), vec.end());
    }
    // Add all vectors to the Faiss index in one go
    index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                        faiss_ids.data());
  }
  faiss_index_ = std::move(index);
  stale_ = false;
  std::cout << "[Index] Rebuilt HNSW graph with " << vectors_.size() << " vectors" << std::endl;
}

std::vector<ScoredChunk> HnswVectorIndex::search(const std::vector<float> &query,
                                                 size_t k) const {
  if (query.size() != dimension_) {
    throw DimensionMismatchError(dimension_, query.size());
  }

  std::lock_guard<std::mutex> lock(faiss_mu_);
  if (k == 0 || vectors_.empty()) {
    return {};
  }
  if (stale_) {
    rebuild_locked();
  }

  const size_t candidates = std::min(k + TIE_MARGIN, vectors_.size());
  const std::vector<float> q = normalize_vector(query);
  std::vector<float> distances(candidates);
  std::vector<faiss::idx_t> labels(candidates);
  faiss_index_->search(1, q.data(), static_cast<faiss::idx_t>(candidates), distances.data(),
                       labels.data());

  std::vector<ScoredChunk> scored;
  scored.reserve(candidates);
  for (size_t i = 0; i < candidates; ++i) {
    if (labels[i] == -1) {
      continue;
    }
    scored.push_back({static_cast<ChunkId>(labels[i]), std::clamp(distances[i], -1.0f, 1.0f)});
  }

  std::sort(scored.begin(), scored.end(), ranks_before);
  if (scored.size() > k) {
    scored.resize(k);
  }
  return scored;
}

void HnswVectorIndex::bulk_load(std::vector<IndexedVector> entries) {
  for (const auto &entry : entries) {
    if (entry.vector.size() != dimension_) {
      throw DimensionMismatchError(dimension_, entry.vector.size());
    }
  }

  std::lock_guard<std::mutex> lock(faiss_mu_);
  vectors_.clear();
  for (auto &entry : entries) {
    vectors_[entry.chunk_id] = std::move(entry.vector);
  }
  rebuild_locked();
}

std::vector<IndexedVector> HnswVectorIndex::entries() const {
  std::lock_guard<std::mutex> lock(faiss_mu_);
  std::vector<IndexedVector> out;
  out.reserve(vectors_.size());
  for (const auto &[id, vec] : vectors_) {
    out.push_back({id, vec});
  }
  return out;
}

void HnswVectorIndex::clear() {
  std::lock_guard<std::mutex> lock(faiss_mu_);
  vectors_.clear();
  faiss_index_ = create_base_index();
  stale_ = false;
}

}  // namespace scribe_core
