#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "scribe_core/types/document.hpp"

namespace scribe_core {

// A document could not be read or parsed. Batch ingestion skips it.
class IngestionError : public std::exception {
 public:
  explicit IngestionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class DocumentLoader
 * @brief Reads plain-text and Markdown documents from disk.
 */
class DocumentLoader {
 public:
  explicit DocumentLoader(bool recursive = false);

  bool can_handle(const std::filesystem::path &file_path) const;

  // Supported files in the folder, sorted by path.
  // @throws IngestionError if the folder does not exist.
  std::vector<std::filesystem::path> list(const std::filesystem::path &folder) const;

  /**
   * @brief Reads a file as UTF-8. Invalid sequences are replaced with U+FFFD.
   * @param document_id Identifier for the document; the file name if empty.
   * @throws IngestionError if the file is unsupported or unreadable.
   */
  Document load(const std::filesystem::path &file_path, const std::string &document_id = "") const;

 private:
  bool recursive_;
};

}  // namespace scribe_core
