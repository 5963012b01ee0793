#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "scribe_core/types/chunk.hpp"

namespace scribe_core {

// The persisted index failed an integrity check. Callers rebuild from source.
class CorruptIndexError : public std::exception {
 public:
  explicit CorruptIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// The index file could not be written, or does not exist.
class IndexStoreError : public std::exception {
 public:
  explicit IndexStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IndexSnapshot {
  size_t dimension = 0;
  ChunkId next_chunk_id = 0;
  std::vector<Chunk> chunks;
  std::vector<IndexedVector> vectors;
};

/**
 * @brief Reads and writes index snapshots as SQLite files.
 *
 * Layout: an index_meta key/value table (format_version, dimension,
 * next_chunk_id), a chunks table holding zstd-compressed text with its
 * document reference and offsets, and a vectors table holding raw float
 * blobs keyed by chunk id.
 */
class IndexFile {
 public:
  static constexpr int FORMAT_VERSION = 1;

  // Writes to a temporary sibling and renames it over path.
  // @throws IndexStoreError on any write failure.
  static void write(const std::filesystem::path &path, const IndexSnapshot &snapshot);

  // @throws IndexStoreError if the file does not exist.
  // @throws CorruptIndexError if the file is unreadable, the stored dimension
  //         differs from expected_dimension, chunk and vector counts differ, a
  //         vector blob is malformed, or a vector references a missing chunk.
  static IndexSnapshot read(const std::filesystem::path &path, size_t expected_dimension);
};

}  // namespace scribe_core
