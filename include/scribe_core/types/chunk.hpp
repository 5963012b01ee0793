#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scribe_core {

using ChunkId = int64_t;

// A contiguous span [start_offset, end_offset) of a document's raw text.
struct Chunk {
  ChunkId id = 0;
  std::string document_ref;
  std::string text;
  size_t start_offset = 0;
  size_t end_offset = 0;
};

// One chunk's embedding, unit-normalized.
struct IndexedVector {
  ChunkId chunk_id = 0;
  std::vector<float> vector;
};

}  // namespace scribe_core
