#include "scribe_core/services/indexing_service.hpp"

#include <iostream>
#include <stdexcept>

namespace scribe_core {

IndexingService::IndexingService(std::shared_ptr<ChunkIndex> index,
                                 std::shared_ptr<EmbeddingGateway> embedder,
                                 ChunkerConfig chunker_config)
    : index_(std::move(index)), embedder_(std::move(embedder)), chunker_(chunker_config) {
  if (!index_ || !embedder_) {
    throw std::invalid_argument("IndexingService requires an index and an embedder");
  }
}

size_t IndexingService::index_document(const Document &document) {
  return index_document(document.document_id, document.raw_text);
}

size_t IndexingService::index_document(const std::string &document_id,
                                       const std::string &raw_text) {
  if (document_id.empty()) {
    throw IngestionError("Document id must not be empty");
  }

  std::vector<Chunk> chunks = chunker_.chunk(document_id, raw_text);

  std::vector<std::vector<float>> vectors;
  vectors.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    std::vector<float> vector = embedder_->embed(chunk.text);
    if (vector.size() != index_->dimension()) {
      throw DimensionMismatchError(index_->dimension(), vector.size());
    }
    vectors.push_back(std::move(vector));
  }

  index_->remove_document(document_id);
  if (!chunks.empty()) {
    const ChunkId first_id = index_->allocate_ids(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
      chunks[i].id = first_id + static_cast<ChunkId>(i);
      index_->add(chunks[i], vectors[i]);
    }
  }

  std::cout << "[Indexing] Indexed '" << document_id << "' as " << chunks.size() << " chunks"
            << std::endl;
  return chunks.size();
}

IndexingReport IndexingService::index_documents(const std::vector<Document> &documents) {
  IndexingReport report;
  for (const auto &document : documents) {
    try {
      report.chunks += index_document(document);
      ++report.indexed;
    } catch (const IngestionError &e) {
      std::cerr << "[Indexing] Skipping '" << document.document_id << "': " << e.what()
                << std::endl;
      ++report.skipped;
      report.failures.push_back(document.document_id + ": " + e.what());
    } catch (const DimensionMismatchError &e) {
      std::cerr << "[Indexing] Skipping '" << document.document_id << "': " << e.what()
                << std::endl;
      ++report.skipped;
      report.failures.push_back(document.document_id + ": " + e.what());
    }
  }
  return report;
}

IndexingReport IndexingService::index_folder(const std::filesystem::path &folder,
                                             const DocumentLoader &loader) {
  std::vector<Document> documents;
  IndexingReport load_report;
  for (const auto &file : loader.list(folder)) {
    try {
      std::string document_id = std::filesystem::relative(file, folder).generic_string();
      documents.push_back(loader.load(file, document_id));
    } catch (const IngestionError &e) {
      std::cerr << "[Indexing] Skipping " << file.string() << ": " << e.what() << std::endl;
      ++load_report.skipped;
      load_report.failures.push_back(file.string() + ": " + e.what());
    }
  }

  IndexingReport report = index_documents(documents);
  report.skipped += load_report.skipped;
  report.failures.insert(report.failures.end(), load_report.failures.begin(),
                         load_report.failures.end());

  std::cout << "[Indexing] Folder " << folder.string() << ": " << report.indexed
            << " indexed, " << report.skipped << " skipped, " << report.chunks << " chunks"
            << std::endl;
  return report;
}

size_t IndexingService::remove_document(const std::string &document_id) {
  return index_->remove_document(document_id);
}

}  // namespace scribe_core
