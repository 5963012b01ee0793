#pragma once

#include <string>
#include <vector>

#include "scribe_core/types/chunk.hpp"

namespace scribe_core {

enum class ResultSource { Local, Online };

// Conversion utilities
std::string to_string(ResultSource source);
ResultSource result_source_from_string(const std::string& str);

// Online results carry no chunk and use this id.
constexpr ChunkId kNoChunk = -1;

struct SearchResult {
  ChunkId chunk_id = kNoChunk;
  float score = 0.0f;
  ResultSource source = ResultSource::Local;
  std::string text;
  std::string attribution;
};

}  // namespace scribe_core
