#pragma once

#include <unordered_map>
#include <vector>

#include "scribe_core/index/vector_index.hpp"

namespace scribe_core {

// Exact cosine search by linear scan. Suitable for corpora of a few
// thousand chunks.
class FlatVectorIndex : public VectorIndex {
 public:
  explicit FlatVectorIndex(size_t dimension);

  void add(ChunkId chunk_id, const std::vector<float> &vector) override;
  void remove(ChunkId chunk_id) override;
  std::vector<ScoredChunk> search(const std::vector<float> &query, size_t k) const override;
  void bulk_load(std::vector<IndexedVector> entries) override;
  std::vector<IndexedVector> entries() const override;

  bool contains(ChunkId chunk_id) const override {
    return slots_.count(chunk_id) > 0;
  }
  size_t size() const override {
    return ids_.size();
  }
  size_t dimension() const override {
    return dimension_;
  }
  void clear() override;
  std::string backend_name() const override {
    return "flat";
  }

 private:
  void store(ChunkId chunk_id, const std::vector<float> &normalized);

  size_t dimension_;
  // Row-major storage; row i belongs to ids_[i].
  std::vector<float> data_;
  std::vector<ChunkId> ids_;
  std::unordered_map<ChunkId, size_t> slots_;
};

}  // namespace scribe_core
