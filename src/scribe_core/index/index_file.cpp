#include "scribe_core/index/index_file.hpp"

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <cstring>
#include <iostream>
#include <map>
#include <unordered_set>

#include "scribe_core/services/compression_service.hpp"

namespace scribe_core {

namespace {

std::string classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return "busy_or_locked";
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return "corrupt";
    case SQLITE_IOERR:
      return "io";
    case SQLITE_CANTOPEN:
      return "cantopen";
    case SQLITE_FULL:
      return "full";
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return "schema";
    default:
      return "generic";
  }
}

std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  return operation + " failed: (" + classify_sqlite_code(e.get_code()) + ") " + e.errstr() +
         " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

// Rolls back unless commit() is reached.
class WriteTransaction {
 public:
  explicit WriteTransaction(sqlite::database &db) : db_(db) {
    db_ << "BEGIN IMMEDIATE;";
  }

  WriteTransaction(const WriteTransaction &) = delete;
  WriteTransaction &operator=(const WriteTransaction &) = delete;

  void commit() {
    db_ << "COMMIT;";
    active_ = false;
  }

  ~WriteTransaction() {
    if (active_) {
      try {
        db_ << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception &e) {
        std::cerr << "[IndexFile] Rollback failed: " << e.what() << std::endl;
      }
    }
  }

 private:
  sqlite::database &db_;
  bool active_ = true;
};

void create_schema(sqlite::database &db) {
  db << R"(
      CREATE TABLE index_meta (
          key TEXT PRIMARY KEY,
          value TEXT NOT NULL
      )
    )";
  db << R"(
      CREATE TABLE chunks (
          id INTEGER PRIMARY KEY,
          document_ref TEXT NOT NULL,
          start_offset INTEGER NOT NULL,
          end_offset INTEGER NOT NULL,
          content BLOB NOT NULL
      )
    )";
  db << R"(
      CREATE TABLE vectors (
          chunk_id INTEGER PRIMARY KEY,
          vector_blob BLOB NOT NULL
      )
    )";
}

size_t parse_size(const std::map<std::string, std::string> &meta, const std::string &key) {
  auto it = meta.find(key);
  if (it == meta.end()) {
    throw CorruptIndexError("Index metadata is missing '" + key + "'");
  }
  try {
    return static_cast<size_t>(std::stoull(it->second));
  } catch (const std::exception &) {
    throw CorruptIndexError("Index metadata '" + key + "' is not a number: " + it->second);
  }
}

}  // namespace

void IndexFile::write(const std::filesystem::path &path, const IndexSnapshot &snapshot) {
  std::filesystem::path tmp_path = path;
  tmp_path += ".tmp";

  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::filesystem::remove(tmp_path, ec);

  try {
    {
      sqlite::database db(tmp_path.string());
      create_schema(db);

      WriteTransaction tx(db);
      db << "INSERT INTO index_meta (key, value) VALUES (?, ?)" << "format_version"
         << std::to_string(FORMAT_VERSION);
      db << "INSERT INTO index_meta (key, value) VALUES (?, ?)" << "dimension"
         << std::to_string(snapshot.dimension);
      db << "INSERT INTO index_meta (key, value) VALUES (?, ?)" << "next_chunk_id"
         << std::to_string(snapshot.next_chunk_id);

      for (const auto &chunk : snapshot.chunks) {
        db << "INSERT INTO chunks (id, document_ref, start_offset, end_offset, content) "
              "VALUES (?, ?, ?, ?, ?)"
           << static_cast<int64_t>(chunk.id) << chunk.document_ref
           << static_cast<int64_t>(chunk.start_offset) << static_cast<int64_t>(chunk.end_offset)
           << CompressionService::compress(chunk.text);
      }

      for (const auto &entry : snapshot.vectors) {
        std::vector<char> vector_blob(entry.vector.size() * sizeof(float));
        std::memcpy(vector_blob.data(), entry.vector.data(), vector_blob.size());
        db << "INSERT INTO vectors (chunk_id, vector_blob) VALUES (?, ?)"
           << static_cast<int64_t>(entry.chunk_id) << vector_blob;
      }
      tx.commit();
    }

    std::filesystem::rename(tmp_path, path);
  } catch (const sqlite::sqlite_exception &e) {
    std::filesystem::remove(tmp_path, ec);
    throw IndexStoreError(format_db_error("persist index", e));
  } catch (const std::filesystem::filesystem_error &e) {
    std::filesystem::remove(tmp_path, ec);
    throw IndexStoreError(std::string("persist index failed: ") + e.what());
  } catch (const CompressionError &e) {
    std::filesystem::remove(tmp_path, ec);
    throw IndexStoreError(std::string("persist index failed: ") + e.what());
  }

  std::cout << "[IndexFile] Wrote " << snapshot.chunks.size() << " chunks to " << path.string()
            << std::endl;
}

IndexSnapshot IndexFile::read(const std::filesystem::path &path, size_t expected_dimension) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw IndexStoreError("Index file not found: " + path.string());
  }

  IndexSnapshot snapshot;
  try {
    sqlite::database db(path.string());

    std::map<std::string, std::string> meta;
    db << "SELECT key, value FROM index_meta" >> [&](std::string key, std::string value) {
      meta[key] = value;
    };

    const size_t version = parse_size(meta, "format_version");
    if (version != static_cast<size_t>(FORMAT_VERSION)) {
      throw CorruptIndexError("Unsupported index format version " + std::to_string(version));
    }
    snapshot.dimension = parse_size(meta, "dimension");
    if (snapshot.dimension != expected_dimension) {
      throw CorruptIndexError("Stored dimension " + std::to_string(snapshot.dimension) +
                              " does not match configured dimension " +
                              std::to_string(expected_dimension));
    }
    snapshot.next_chunk_id = static_cast<ChunkId>(parse_size(meta, "next_chunk_id"));

    int64_t chunk_count = 0;
    int64_t vector_count = 0;
    db << "SELECT count(*) FROM chunks" >> chunk_count;
    db << "SELECT count(*) FROM vectors" >> vector_count;
    if (chunk_count != vector_count) {
      throw CorruptIndexError("Index holds " + std::to_string(vector_count) + " vectors but " +
                              std::to_string(chunk_count) + " chunk records");
    }

    std::unordered_set<ChunkId> chunk_ids;
    db << "SELECT id, document_ref, start_offset, end_offset, content FROM chunks ORDER BY id" >>
        [&](int64_t id, std::string document_ref, int64_t start_offset, int64_t end_offset,
            std::vector<char> content) {
          Chunk chunk;
          chunk.id = static_cast<ChunkId>(id);
          chunk.document_ref = std::move(document_ref);
          chunk.start_offset = static_cast<size_t>(start_offset);
          chunk.end_offset = static_cast<size_t>(end_offset);
          try {
            chunk.text = CompressionService::decompress(content);
          } catch (const CompressionError &e) {
            throw CorruptIndexError("Chunk " + std::to_string(id) + " content: " + e.what());
          }
          if (end_offset < start_offset ||
              chunk.text.size() != static_cast<size_t>(end_offset - start_offset)) {
            throw CorruptIndexError("Chunk " + std::to_string(id) +
                                    " offsets disagree with its text");
          }
          chunk_ids.insert(chunk.id);
          snapshot.chunks.push_back(std::move(chunk));
        };

    const size_t expected_bytes = snapshot.dimension * sizeof(float);
    db << "SELECT chunk_id, vector_blob FROM vectors ORDER BY chunk_id" >>
        [&](int64_t chunk_id, std::vector<char> vector_blob) {
          if (vector_blob.size() != expected_bytes) {
            throw CorruptIndexError("Vector for chunk " + std::to_string(chunk_id) + " has " +
                                    std::to_string(vector_blob.size()) + " bytes, expected " +
                                    std::to_string(expected_bytes));
          }
          if (chunk_ids.count(static_cast<ChunkId>(chunk_id)) == 0) {
            throw CorruptIndexError("Vector references missing chunk " + std::to_string(chunk_id));
          }
          IndexedVector entry;
          entry.chunk_id = static_cast<ChunkId>(chunk_id);
          entry.vector.resize(snapshot.dimension);
          std::memcpy(entry.vector.data(), vector_blob.data(), expected_bytes);
          snapshot.vectors.push_back(std::move(entry));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw CorruptIndexError(format_db_error("load index", e));
  }

  return snapshot;
}

}  // namespace scribe_core
