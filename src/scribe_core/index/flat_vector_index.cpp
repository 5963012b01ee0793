#include "scribe_core/index/flat_vector_index.hpp"

#include <algorithm>
#include <stdexcept>

namespace scribe_core {

FlatVectorIndex::FlatVectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw std::invalid_argument("FlatVectorIndex dimension must be greater than 0");
  }
}

void FlatVectorIndex::add(ChunkId chunk_id, const std::vector<float> &vector) {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
  store(chunk_id, normalize_vector(vector));
}

void FlatVectorIndex::store(ChunkId chunk_id, const std::vector<float> &normalized) {
  auto it = slots_.find(chunk_id);
  if (it != slots_.end()) {
    std::copy(normalized.begin(), normalized.end(), data_.begin() + it->second * dimension_);
    return;
  }
  slots_[chunk_id] = ids_.size();
  ids_.push_back(chunk_id);
  data_.insert(data_.end(), normalized.begin(), normalized.end());
}

void FlatVectorIndex::remove(ChunkId chunk_id) {
  auto it = slots_.find(chunk_id);
  if (it == slots_.end()) {
    return;
  }

  // Move the last row into the freed slot
  const size_t slot = it->second;
  const size_t last = ids_.size() - 1;
  if (slot != last) {
    std::copy(data_.begin() + last * dimension_, data_.begin() + (last + 1) * dimension_,
              data_.begin() + slot * dimension_);
    ids_[slot] = ids_[last];
    slots_[ids_[slot]] = slot;
  }
  ids_.pop_back();
  data_.resize(ids_.size() * dimension_);
  slots_.erase(chunk_id);
}

std::vector<ScoredChunk> FlatVectorIndex::search(const std::vector<float> &query,
                                                 size_t k) const {
  if (query.size() != dimension_) {
    throw DimensionMismatchError(dimension_, query.size());
  }
  if (k == 0 || ids_.empty()) {
    return {};
  }

  const std::vector<float> q = normalize_vector(query);
  std::vector<ScoredChunk> scored;
  scored.reserve(ids_.size());
  for (size_t row = 0; row < ids_.size(); ++row) {
    const float *v = data_.data() + row * dimension_;
    float dot = 0.0f;
    for (size_t j = 0; j < dimension_; ++j) {
      dot += q[j] * v[j];
    }
    scored.push_back({ids_[row], std::clamp(dot, -1.0f, 1.0f)});
  }

  const size_t actual_k = std::min(k, scored.size());
  std::partial_sort(scored.begin(), scored.begin() + actual_k, scored.end(), ranks_before);
  scored.resize(actual_k);
  return scored;
}

void FlatVectorIndex::bulk_load(std::vector<IndexedVector> entries) {
  for (const auto &entry : entries) {
    if (entry.vector.size() != dimension_) {
      throw DimensionMismatchError(dimension_, entry.vector.size());
    }
  }
  clear();
  ids_.reserve(entries.size());
  data_.reserve(entries.size() * dimension_);
  for (const auto &entry : entries) {
    store(entry.chunk_id, entry.vector);
  }
}

std::vector<IndexedVector> FlatVectorIndex::entries() const {
  std::vector<IndexedVector> out;
  out.reserve(ids_.size());
  for (size_t row = 0; row < ids_.size(); ++row) {
    const float *v = data_.data() + row * dimension_;
    out.push_back({ids_[row], std::vector<float>(v, v + dimension_)});
  }
  std::sort(out.begin(), out.end(),
            [](const IndexedVector &a, const IndexedVector &b) { return a.chunk_id < b.chunk_id; });
  return out;
}

void FlatVectorIndex::clear() {
  data_.clear();
  ids_.clear();
  slots_.clear();
}

}  // namespace scribe_core
