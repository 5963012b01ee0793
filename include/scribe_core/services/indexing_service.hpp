#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "scribe_core/chunking/chunker.hpp"
#include "scribe_core/gateways/embedding_gateway.hpp"
#include "scribe_core/index/chunk_index.hpp"
#include "scribe_core/services/document_loader.hpp"
#include "scribe_core/types/document.hpp"

namespace scribe_core {

struct IndexingReport {
  size_t indexed = 0;
  size_t skipped = 0;
  size_t chunks = 0;
  std::vector<std::string> failures;
};

/**
 * @class IndexingService
 * @brief Chunks documents, embeds the chunks and adds them to the index.
 */
class IndexingService {
 public:
  IndexingService(std::shared_ptr<ChunkIndex> index,
                  std::shared_ptr<EmbeddingGateway> embedder,
                  ChunkerConfig chunker_config);

  /**
   * @brief Indexes one document, replacing any chunks it already has.
   *
   * Every chunk is embedded before the index is touched, so a failure leaves
   * the previous version of the document searchable.
   * @return Number of chunks indexed.
   * @throws EmbeddingUnavailableError
   * @throws DimensionMismatchError if the embedder returns the wrong size.
   */
  size_t index_document(const std::string &document_id, const std::string &raw_text);
  size_t index_document(const Document &document);

  // Documents that fail with IngestionError or DimensionMismatchError are
  // logged and skipped. EmbeddingUnavailableError aborts the batch.
  IndexingReport index_documents(const std::vector<Document> &documents);

  // Loads and indexes every supported file in the folder.
  // @throws IngestionError if the folder cannot be listed.
  IndexingReport index_folder(const std::filesystem::path &folder, const DocumentLoader &loader);

  size_t remove_document(const std::string &document_id);

 private:
  std::shared_ptr<ChunkIndex> index_;
  std::shared_ptr<EmbeddingGateway> embedder_;
  Chunker chunker_;
};

}  // namespace scribe_core
