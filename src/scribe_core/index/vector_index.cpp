#include "scribe_core/index/vector_index.hpp"

#include <cmath>
#include <stdexcept>

#include "scribe_core/index/flat_vector_index.hpp"
#include "scribe_core/index/hnsw_vector_index.hpp"

namespace scribe_core {

std::string to_string(IndexBackend backend) {
  switch (backend) {
    case IndexBackend::Flat:
      return "flat";
    case IndexBackend::Hnsw:
      return "hnsw";
    default:
      return "unknown";
  }
}

IndexBackend index_backend_from_string(const std::string &str) {
  if (str == "flat")
    return IndexBackend::Flat;
  if (str == "hnsw")
    return IndexBackend::Hnsw;
  throw std::invalid_argument("Unknown IndexBackend: " + str);
}

VectorIndexPtr make_vector_index(IndexBackend backend, size_t dimension) {
  switch (backend) {
    case IndexBackend::Flat:
      return std::make_unique<FlatVectorIndex>(dimension);
    case IndexBackend::Hnsw:
      return std::make_unique<HnswVectorIndex>(dimension);
  }
  throw std::invalid_argument("Unsupported index backend");
}

std::vector<float> normalize_vector(const std::vector<float> &vector) {
  double sum = 0.0;
  for (float v : vector) {
    sum += static_cast<double>(v) * v;
  }
  if (sum == 0.0) {
    return vector;
  }
  const double norm = std::sqrt(sum);
  std::vector<float> out(vector.size());
  for (size_t i = 0; i < vector.size(); ++i) {
    out[i] = static_cast<float>(vector[i] / norm);
  }
  return out;
}

bool ranks_before(const ScoredChunk &a, const ScoredChunk &b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  return a.chunk_id < b.chunk_id;
}

}  // namespace scribe_core
