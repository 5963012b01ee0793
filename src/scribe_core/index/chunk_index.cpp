#include "scribe_core/index/chunk_index.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace scribe_core {

ChunkIndex::ChunkIndex(IndexBackend backend, size_t dimension)
    : backend_(backend), dimension_(dimension), vectors_(make_vector_index(backend, dimension)) {}

void ChunkIndex::add(const Chunk &chunk, const std::vector<float> &vector) {
  std::unique_lock lock(mutex_);
  // The backend validates the dimension before anything is recorded here.
  vectors_->add(chunk.id, vector);

  auto existing = chunks_.find(chunk.id);
  if (existing != chunks_.end()) {
    auto count = document_chunk_counts_.find(existing->second.document_ref);
    if (count != document_chunk_counts_.end() && --count->second == 0) {
      document_chunk_counts_.erase(count);
    }
  }
  chunks_[chunk.id] = chunk;
  ++document_chunk_counts_[chunk.document_ref];
  next_id_ = std::max(next_id_, chunk.id + 1);
}

bool ChunkIndex::remove(ChunkId chunk_id) {
  std::unique_lock lock(mutex_);
  auto it = chunks_.find(chunk_id);
  if (it == chunks_.end()) {
    return false;
  }
  auto count = document_chunk_counts_.find(it->second.document_ref);
  if (count != document_chunk_counts_.end() && --count->second == 0) {
    document_chunk_counts_.erase(count);
  }
  vectors_->remove(chunk_id);
  chunks_.erase(it);
  return true;
}

size_t ChunkIndex::remove_document(const std::string &document_ref) {
  std::unique_lock lock(mutex_);
  std::vector<ChunkId> doomed;
  for (const auto &[id, chunk] : chunks_) {
    if (chunk.document_ref == document_ref) {
      doomed.push_back(id);
    }
  }
  for (ChunkId id : doomed) {
    vectors_->remove(id);
    chunks_.erase(id);
  }
  document_chunk_counts_.erase(document_ref);

  if (!doomed.empty()) {
    std::cout << "[Index] Removed " << doomed.size() << " chunks of '" << document_ref << "'"
              << std::endl;
  }
  return doomed.size();
}

std::vector<SearchResult> ChunkIndex::search(const std::vector<float> &query, size_t k) const {
  std::shared_lock lock(mutex_);
  std::vector<ScoredChunk> hits = vectors_->search(query, k);

  std::vector<SearchResult> results;
  results.reserve(hits.size());
  for (const auto &hit : hits) {
    auto it = chunks_.find(hit.chunk_id);
    if (it == chunks_.end()) {
      std::cerr << "[Index] Vector " << hit.chunk_id << " has no chunk record, skipping"
                << std::endl;
      continue;
    }
    SearchResult result;
    result.chunk_id = hit.chunk_id;
    result.score = hit.score;
    result.source = ResultSource::Local;
    result.text = it->second.text;
    result.attribution = it->second.document_ref;
    results.push_back(std::move(result));
  }
  return results;
}

std::optional<Chunk> ChunkIndex::chunk(ChunkId chunk_id) const {
  std::shared_lock lock(mutex_);
  auto it = chunks_.find(chunk_id);
  if (it == chunks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ChunkId ChunkIndex::allocate_ids(size_t n) {
  std::unique_lock lock(mutex_);
  ChunkId first = next_id_;
  next_id_ += static_cast<ChunkId>(n);
  return first;
}

size_t ChunkIndex::size() const {
  std::shared_lock lock(mutex_);
  return chunks_.size();
}

size_t ChunkIndex::document_count() const {
  std::shared_lock lock(mutex_);
  return document_chunk_counts_.size();
}

size_t ChunkIndex::dimension() const {
  return dimension_;
}

std::string ChunkIndex::backend_name() const {
  std::shared_lock lock(mutex_);
  return vectors_->backend_name();
}

void ChunkIndex::clear() {
  std::unique_lock lock(mutex_);
  vectors_->clear();
  chunks_.clear();
  document_chunk_counts_.clear();
}

void ChunkIndex::persist(const std::filesystem::path &path) const {
  IndexSnapshot snapshot;
  {
    std::shared_lock lock(mutex_);
    snapshot.dimension = dimension_;
    snapshot.next_chunk_id = next_id_;
    snapshot.vectors = vectors_->entries();
    snapshot.chunks.reserve(chunks_.size());
    for (const auto &[id, chunk] : chunks_) {
      snapshot.chunks.push_back(chunk);
    }
  }
  std::sort(snapshot.chunks.begin(), snapshot.chunks.end(),
            [](const Chunk &a, const Chunk &b) { return a.id < b.id; });

  IndexFile::write(path, snapshot);
}

void ChunkIndex::load(const std::filesystem::path &path) {
  IndexSnapshot snapshot = IndexFile::read(path, dimension_);

  VectorIndexPtr loaded = make_vector_index(backend_, dimension_);
  loaded->bulk_load(std::move(snapshot.vectors));

  std::unordered_map<ChunkId, Chunk> chunks;
  std::unordered_map<std::string, size_t> counts;
  ChunkId next_id = snapshot.next_chunk_id;
  for (auto &chunk : snapshot.chunks) {
    next_id = std::max(next_id, chunk.id + 1);
    ++counts[chunk.document_ref];
    ChunkId id = chunk.id;
    chunks.emplace(id, std::move(chunk));
  }

  size_t document_total = counts.size();
  {
    std::unique_lock lock(mutex_);
    vectors_ = std::move(loaded);
    chunks_ = std::move(chunks);
    document_chunk_counts_ = std::move(counts);
    next_id_ = next_id;
  }

  std::cout << "[Index] Loaded " << snapshot.chunks.size() << " chunks from " << document_total
            << " documents (" << to_string(backend_) << " backend)" << std::endl;
}

}  // namespace scribe_core
