#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>

#include "scribe_api/config.hpp"

namespace {

using scribe_api::Config;

std::string write_temp_file(const std::string &contents) {
  char filename_template[] = "/tmp/scribe_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE *file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string &path) {
  std::remove(path.c_str());
}

}  // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.index_backend, "flat");
  EXPECT_EQ(cfg.chunk_size, 512);
  EXPECT_EQ(cfg.chunk_overlap, 50);
  EXPECT_DOUBLE_EQ(cfg.similarity_threshold, 0.3);
  EXPECT_EQ(cfg.top_k, 5);
  EXPECT_EQ(cfg.max_context_chars, 1500);
  EXPECT_EQ(cfg.debounce_ms, 500);
  EXPECT_EQ(cfg.min_trigger_chars, 3);
  EXPECT_EQ(cfg.context_window_chars, 100);
  EXPECT_EQ(cfg.suggestion_count, 3);
  EXPECT_TRUE(cfg.online_enabled);
  EXPECT_EQ(cfg.max_online_results, 3);
  EXPECT_EQ(cfg.online_timeout_ms, 3000);
  EXPECT_EQ(cfg.cache_ttl_seconds, 86400);
  EXPECT_FALSE(cfg.keep_sub_threshold_local);
}

TEST(ConfigTest, LoadsFromJson) {
  nlohmann::json j = {{"api_base_url", "0.0.0.0:8080"},
                      {"index_backend", "hnsw"},
                      {"embedding_dimension", 768},
                      {"similarity_threshold", 0.5},
                      {"online_enabled", false},
                      {"num_workers", 2}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.backend(), scribe_core::IndexBackend::Hnsw);
  EXPECT_EQ(cfg.embedding_dimension, 768);
  EXPECT_FLOAT_EQ(cfg.retrieval_config().similarity_threshold, 0.5f);
  EXPECT_FALSE(cfg.retrieval_config().online_enabled);
  EXPECT_EQ(cfg.pipeline_config().num_workers, 2u);
}

TEST(ConfigTest, ConvertsToComponentConfigs) {
  nlohmann::json j = {{"chunk_size", 300},
                      {"chunk_overlap", 30},
                      {"debounce_ms", 250},
                      {"online_timeout_ms", 1200},
                      {"cache_ttl_seconds", 60},
                      {"cache_capacity", 16},
                      {"generation_max_tokens", 64}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.chunker_config().max_chars, 300u);
  EXPECT_EQ(cfg.chunker_config().overlap_chars, 30u);
  EXPECT_EQ(cfg.pipeline_config().debounce, std::chrono::milliseconds(250));
  EXPECT_EQ(cfg.retrieval_config().online_timeout, std::chrono::milliseconds(1200));
  EXPECT_EQ(cfg.cache_config().ttl, std::chrono::seconds(60));
  EXPECT_EQ(cfg.cache_config().capacity, 16u);
  EXPECT_EQ(cfg.ollama_settings().max_tokens, 64);
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(Config::from_json({{"index_backend", "annoy"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"chunk_overlap", 600}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"similarity_threshold", 1.5}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"top_k", 0}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"api_base_url", "no-port"}}), std::runtime_error);
  EXPECT_THROW(Config::from_json({{"num_workers", 0}}), std::runtime_error);
}

TEST(ConfigTest, RejectsWrongTypes) {
  EXPECT_THROW(Config::from_json({{"top_k", "five"}}), std::runtime_error);
}

TEST(ConfigTest, LoadsFromFile) {
  std::string path = write_temp_file(R"({"documents_folder": "/tmp/docs", "top_k": 7})");

  Config cfg = Config::from_file(path);
  remove_file(path);

  EXPECT_EQ(cfg.documents_folder, "/tmp/docs");
  EXPECT_EQ(cfg.top_k, 7);
}

TEST(ConfigTest, FromFileThrowsOnInvalidJson) {
  std::string path = write_temp_file("{ invalid json }");
  EXPECT_THROW(Config::from_file(path), std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, FromFileThrowsWhenMissing) {
  EXPECT_THROW(Config::from_file("/nonexistent/path/scribe.json"), std::runtime_error);
}
