#include "scribe_core/services/document_loader.hpp"

#include <utf8.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace scribe_core {

DocumentLoader::DocumentLoader(bool recursive) : recursive_(recursive) {}

bool DocumentLoader::can_handle(const std::filesystem::path &file_path) const {
  const std::string extension = file_path.extension().string();
  return extension == ".txt" || extension == ".md";
}

std::vector<std::filesystem::path> DocumentLoader::list(const std::filesystem::path &folder) const {
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) {
    throw IngestionError("Document folder does not exist: " + folder.string());
  }

  std::vector<std::filesystem::path> files;
  auto collect = [&](const std::filesystem::directory_entry &entry) {
    if (entry.is_regular_file() && can_handle(entry.path())) {
      files.push_back(entry.path());
    }
  };

  try {
    if (recursive_) {
      for (const auto &entry : std::filesystem::recursive_directory_iterator(folder)) {
        collect(entry);
      }
    } else {
      for (const auto &entry : std::filesystem::directory_iterator(folder)) {
        collect(entry);
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw IngestionError("Could not list " + folder.string() + ": " + e.what());
  }

  std::sort(files.begin(), files.end());
  return files;
}

Document DocumentLoader::load(const std::filesystem::path &file_path,
                              const std::string &document_id) const {
  if (!can_handle(file_path)) {
    throw IngestionError("Unsupported document type: " + file_path.string());
  }

  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw IngestionError("Could not open file: " + file_path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw IngestionError("Could not read file: " + file_path.string());
  }
  const std::string content = buffer.str();

  Document document;
  document.document_id = document_id.empty() ? file_path.filename().string() : document_id;
  if (utf8::is_valid(content.begin(), content.end())) {
    document.raw_text = content;
  } else {
    utf8::replace_invalid(content.begin(), content.end(), std::back_inserter(document.raw_text));
  }
  return document;
}

}  // namespace scribe_core
