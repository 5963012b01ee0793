#pragma once

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "scribe_core/index/index_file.hpp"
#include "scribe_core/index/vector_index.hpp"
#include "scribe_core/types/chunk.hpp"
#include "scribe_core/types/search_result.hpp"

namespace scribe_core {

/**
 * @class ChunkIndex
 * @brief Chunk metadata plus the vector backend that searches it.
 *
 * Every vector in the backend has a chunk record and vice versa. Searches
 * take a shared lock and run in parallel; add, remove and load take the
 * lock exclusively.
 */
class ChunkIndex {
 public:
  ChunkIndex(IndexBackend backend, size_t dimension);

  ChunkIndex(const ChunkIndex &) = delete;
  ChunkIndex &operator=(const ChunkIndex &) = delete;

  // Inserts or overwrites the chunk and its vector.
  // @throws DimensionMismatchError, leaving the index unchanged.
  void add(const Chunk &chunk, const std::vector<float> &vector);

  // @return false if the id was not present.
  bool remove(ChunkId chunk_id);

  // Removes every chunk of a document. @return the number removed.
  size_t remove_document(const std::string &document_ref);

  // Top-k local results with chunk text and document attribution.
  // @throws DimensionMismatchError on a query of the wrong length.
  std::vector<SearchResult> search(const std::vector<float> &query, size_t k) const;

  std::optional<Chunk> chunk(ChunkId chunk_id) const;

  // Reserves n consecutive ids and returns the first.
  ChunkId allocate_ids(size_t n);

  size_t size() const;
  size_t document_count() const;
  size_t dimension() const;
  std::string backend_name() const;
  void clear();

  // @throws IndexStoreError
  void persist(const std::filesystem::path &path) const;

  // Replaces the contents with the file's. On failure the index is unchanged.
  // @throws IndexStoreError if the file is missing.
  // @throws CorruptIndexError if the file fails an integrity check.
  void load(const std::filesystem::path &path);

 private:
  IndexBackend backend_;
  size_t dimension_;

  mutable std::shared_mutex mutex_;
  VectorIndexPtr vectors_;
  std::unordered_map<ChunkId, Chunk> chunks_;
  std::unordered_map<std::string, size_t> document_chunk_counts_;
  ChunkId next_id_ = 0;
};

}  // namespace scribe_core
