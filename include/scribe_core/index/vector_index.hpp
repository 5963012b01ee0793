#pragma once

#include <memory>
#include <string>
#include <vector>

#include "scribe_core/types/chunk.hpp"

namespace scribe_core {

class DimensionMismatchError : public std::exception {
 public:
  DimensionMismatchError(size_t expected, size_t actual)
      : expected_(expected),
        actual_(actual),
        message_("Vector dimension mismatch. Expected " + std::to_string(expected) + ", got " +
                 std::to_string(actual)) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
  std::string message_;
};

struct ScoredChunk {
  ChunkId chunk_id;
  float score;
};

/**
 * @class VectorIndex
 * @brief Capability interface for nearest-neighbour search over chunk vectors.
 *
 * Scores are cosine similarities in [-1, 1]. Results are ordered by
 * descending score, ties broken by ascending chunk id. Implementations are
 * not internally synchronized for writers; ChunkIndex serializes add/remove
 * against concurrent searches.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Normalizes and inserts, overwriting any existing entry for the id.
  // Throws DimensionMismatchError if vector.size() != dimension().
  virtual void add(ChunkId chunk_id, const std::vector<float> &vector) = 0;

  // No-op when the id is absent.
  virtual void remove(ChunkId chunk_id) = 0;

  // Throws DimensionMismatchError if query.size() != dimension().
  virtual std::vector<ScoredChunk> search(const std::vector<float> &query, size_t k) const = 0;

  // Replaces the contents with already-normalized entries (used when restoring
  // a persisted index so stored vectors are kept bit-for-bit).
  virtual void bulk_load(std::vector<IndexedVector> entries) = 0;

  // Snapshot of all entries ordered by chunk id.
  virtual std::vector<IndexedVector> entries() const = 0;

  virtual bool contains(ChunkId chunk_id) const = 0;
  virtual size_t size() const = 0;
  virtual size_t dimension() const = 0;
  virtual void clear() = 0;
  virtual std::string backend_name() const = 0;
};

using VectorIndexPtr = std::unique_ptr<VectorIndex>;

enum class IndexBackend { Flat, Hnsw };

std::string to_string(IndexBackend backend);
IndexBackend index_backend_from_string(const std::string &str);

VectorIndexPtr make_vector_index(IndexBackend backend, size_t dimension);

// Scales the vector to unit length. Zero vectors are returned unchanged.
std::vector<float> normalize_vector(const std::vector<float> &vector);

// Orders by descending score, then ascending chunk id.
bool ranks_before(const ScoredChunk &a, const ScoredChunk &b);

}  // namespace scribe_core
