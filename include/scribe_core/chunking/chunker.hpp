#pragma once

#include <string>
#include <vector>

#include "scribe_core/types/chunk.hpp"

namespace scribe_core {

struct ChunkerConfig {
  size_t max_chars = 512;
  size_t overlap_chars = 50;
};

/**
 * @class Chunker
 * @brief Splits a document's text into overlapping, sentence-aligned chunks.
 *
 * Sentences end at '.', '!' or '?' followed by whitespace, or at a blank line.
 * Whitespace after a terminator belongs to the sentence before it, so the
 * sentences tile the text exactly. Sentences are accumulated until the next
 * one would push the chunk past max_chars. The next chunk re-includes the
 * trailing sentences of the previous one that fit inside overlap_chars, or
 * the raw trailing overlap_chars bytes when no whole sentence fits.
 *
 * A sentence longer than max_chars is emitted as its own oversized chunk and
 * is never split.
 */
class Chunker {
 public:
  explicit Chunker(ChunkerConfig config);

  /**
   * @brief Chunks a document.
   * @param document_ref Identifier stored on every produced chunk.
   * @param text Raw document text.
   * @param first_id Id of the first chunk; following chunks count up from it.
   * @return Chunks in document order. Empty for blank text.
   */
  std::vector<Chunk> chunk(const std::string& document_ref,
                           const std::string& text,
                           ChunkId first_id = 0) const;

  const ChunkerConfig& config() const {
    return config_;
  }

 private:
  struct Span {
    size_t start;
    size_t end;
  };

  std::vector<Span> split_sentences(const std::string& text) const;
  size_t overlap_start(const std::string& text,
                       const std::vector<Span>& sentences,
                       size_t first_sentence,
                       size_t last_sentence,
                       size_t chunk_start) const;

  ChunkerConfig config_;
};

}  // namespace scribe_core
