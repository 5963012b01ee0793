#include "scribe_core/cache/cache_store.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace scribe_core {

namespace {

nlohmann::json result_to_json(const SearchResult &result) {
  return {{"chunk_id", result.chunk_id},
          {"score", result.score},
          {"source", to_string(result.source)},
          {"text", result.text},
          {"attribution", result.attribution}};
}

SearchResult result_from_json(const nlohmann::json &j) {
  SearchResult result;
  result.chunk_id = j.at("chunk_id").get<ChunkId>();
  result.score = j.at("score").get<float>();
  result.source = result_source_from_string(j.at("source").get<std::string>());
  result.text = j.at("text").get<std::string>();
  result.attribution = j.value("attribution", "");
  return result;
}

}  // namespace

JsonFileCacheStore::JsonFileCacheStore(std::filesystem::path path) : path_(std::move(path)) {}

std::vector<CacheEntry> JsonFileCacheStore::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return {};
  }

  std::ifstream file(path_);
  if (!file.is_open()) {
    throw CacheCorruptionError("Could not open cache file: " + path_.string());
  }

  std::vector<CacheEntry> entries;
  try {
    nlohmann::json doc;
    file >> doc;

    if (doc.at("version").get<int>() != FORMAT_VERSION) {
      throw CacheCorruptionError("Unsupported cache format version in " + path_.string());
    }

    for (const auto &item : doc.at("entries")) {
      CacheEntry entry;
      entry.query_key = item.at("key").get<std::string>();
      entry.fetched_at = std::chrono::system_clock::time_point(
          std::chrono::milliseconds(item.at("fetched_at").get<int64_t>()));
      entry.ttl = std::chrono::seconds(item.at("ttl_s").get<int64_t>());
      for (const auto &result : item.at("results")) {
        entry.results.push_back(result_from_json(result));
      }
      entries.push_back(std::move(entry));
    }
  } catch (const nlohmann::json::exception &e) {
    throw CacheCorruptionError("Malformed cache file " + path_.string() + ": " + e.what());
  } catch (const std::invalid_argument &e) {
    throw CacheCorruptionError("Malformed cache file " + path_.string() + ": " + e.what());
  }
  return entries;
}

void JsonFileCacheStore::save(const std::vector<CacheEntry> &entries) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto &entry : entries) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto &result : entry.results) {
      results.push_back(result_to_json(result));
    }
    items.push_back({{"key", entry.query_key},
                     {"fetched_at", std::chrono::duration_cast<std::chrono::milliseconds>(
                                        entry.fetched_at.time_since_epoch())
                                        .count()},
                     {"ttl_s", entry.ttl.count()},
                     {"results", results}});
  }
  nlohmann::json doc = {{"version", FORMAT_VERSION}, {"entries", items}};

  // Online text is not guaranteed to be UTF-8; invalid bytes become U+FFFD
  std::string serialized;
  try {
    serialized = doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception &e) {
    throw CacheStoreError("Could not serialize cache: " + std::string(e.what()));
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }

  std::filesystem::path tmp_path = path_;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      throw CacheStoreError("Could not write cache file: " + tmp_path.string());
    }
    out << serialized;
    if (!out) {
      throw CacheStoreError("Short write to cache file: " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    throw CacheStoreError("Could not replace cache file " + path_.string());
  }
}

void JsonFileCacheStore::erase_all() {
  std::error_code ec;
  std::filesystem::remove(path_, ec);
}

}  // namespace scribe_core
