#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "scribe_core/index/chunk_index.hpp"
#include "utilities_test.hpp"

namespace scribe_tests {

using namespace scribe_core;

class ChunkIndexTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    index_ = std::make_unique<ChunkIndex>(IndexBackend::Flat, kDimension);
    index_path_ = temp_dir_ / "index.db";
  }

  void populate() {
    index_->add(TestUtilities::make_chunk(0, "a.txt", "Cells divide by mitosis."),
                TestUtilities::one_hot(kDimension, 0));
    index_->add(TestUtilities::make_chunk(1, "a.txt", "Mitosis has four phases.", 24),
                TestUtilities::one_hot(kDimension, 1));
    index_->add(TestUtilities::make_chunk(2, "b.md", "Rivers erode valleys."),
                TestUtilities::one_hot(kDimension, 2));
  }

  static constexpr size_t kDimension = 8;
  std::unique_ptr<ChunkIndex> index_;
  std::filesystem::path index_path_;
};

TEST_F(ChunkIndexTest, SearchReturnsLocalResultsWithAttribution) {
  populate();

  auto results = index_->search(TestUtilities::one_hot(kDimension, 1), 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk_id, 1);
  EXPECT_EQ(results[0].source, ResultSource::Local);
  EXPECT_EQ(results[0].text, "Mitosis has four phases.");
  EXPECT_EQ(results[0].attribution, "a.txt");
  EXPECT_NEAR(results[0].score, 1.0f, 1e-6);
}

TEST_F(ChunkIndexTest, TracksDocumentsAndIds) {
  populate();

  EXPECT_EQ(index_->size(), 3u);
  EXPECT_EQ(index_->document_count(), 2u);
  EXPECT_EQ(index_->allocate_ids(5), 3);
  EXPECT_EQ(index_->allocate_ids(1), 8);
}

TEST_F(ChunkIndexTest, RemoveKeepsChunksAndVectorsInSync) {
  populate();

  EXPECT_TRUE(index_->remove(2));
  EXPECT_FALSE(index_->remove(2));
  EXPECT_FALSE(index_->chunk(2).has_value());
  EXPECT_EQ(index_->document_count(), 1u);

  auto results = index_->search(TestUtilities::one_hot(kDimension, 2), 5);
  for (const auto &result : results) {
    EXPECT_NE(result.chunk_id, 2);
  }
}

TEST_F(ChunkIndexTest, RemoveDocumentDropsAllItsChunks) {
  populate();

  EXPECT_EQ(index_->remove_document("a.txt"), 2u);
  EXPECT_EQ(index_->remove_document("a.txt"), 0u);
  EXPECT_EQ(index_->size(), 1u);
  EXPECT_EQ(index_->document_count(), 1u);
}

TEST_F(ChunkIndexTest, AddWithWrongDimensionLeavesIndexUnchanged) {
  populate();

  EXPECT_THROW(index_->add(TestUtilities::make_chunk(9, "c.txt", "x"), {1.0f, 0.0f}),
               DimensionMismatchError);
  EXPECT_EQ(index_->size(), 3u);
  EXPECT_FALSE(index_->chunk(9).has_value());
}

TEST_F(ChunkIndexTest, PersistAndLoadRoundTrip) {
  populate();
  index_->persist(index_path_);

  ChunkIndex restored(IndexBackend::Hnsw, kDimension);
  restored.load(index_path_);

  EXPECT_EQ(restored.size(), 3u);
  EXPECT_EQ(restored.document_count(), 2u);
  auto chunk = restored.chunk(1);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(chunk->text, "Mitosis has four phases.");
  EXPECT_EQ(chunk->start_offset, 24u);
  EXPECT_EQ(chunk->end_offset, 48u);

  auto before = index_->search(TestUtilities::one_hot(kDimension, 2), 3);
  auto after = restored.search(TestUtilities::one_hot(kDimension, 2), 3);
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(before[i].chunk_id, after[i].chunk_id);
    EXPECT_NEAR(before[i].score, after[i].score, 1e-6);
  }

  // Ids keep counting past the restored ones
  EXPECT_EQ(restored.allocate_ids(1), 3);
}

TEST_F(ChunkIndexTest, PersistOverwritesPreviousFile) {
  populate();
  index_->persist(index_path_);
  index_->remove_document("b.md");
  index_->persist(index_path_);

  ChunkIndex restored(IndexBackend::Flat, kDimension);
  restored.load(index_path_);
  EXPECT_EQ(restored.size(), 2u);
  EXPECT_FALSE(std::filesystem::exists(index_path_.string() + ".tmp"));
}

TEST_F(ChunkIndexTest, LoadMissingFileThrowsStoreError) {
  EXPECT_THROW(index_->load(temp_dir_ / "absent.db"), IndexStoreError);
}

TEST_F(ChunkIndexTest, LoadGarbageFileThrowsCorrupt) {
  TestUtilities::write_file(index_path_, "this is not a database at all, just some text");
  EXPECT_THROW(index_->load(index_path_), CorruptIndexError);
}

TEST_F(ChunkIndexTest, LoadWithOtherDimensionThrowsCorrupt) {
  populate();
  index_->persist(index_path_);

  ChunkIndex other(IndexBackend::Flat, kDimension * 2);
  EXPECT_THROW(other.load(index_path_), CorruptIndexError);
}

TEST_F(ChunkIndexTest, LoadWithMissingVectorThrowsCorrupt) {
  populate();
  index_->persist(index_path_);
  {
    sqlite::database db(index_path_.string());
    db << "DELETE FROM vectors WHERE chunk_id = 1";
  }

  EXPECT_THROW(index_->load(index_path_), CorruptIndexError);
}

TEST_F(ChunkIndexTest, LoadWithTruncatedVectorThrowsCorrupt) {
  populate();
  index_->persist(index_path_);
  {
    sqlite::database db(index_path_.string());
    db << "UPDATE vectors SET vector_blob = substr(vector_blob, 1, 4) WHERE chunk_id = 0";
  }

  EXPECT_THROW(index_->load(index_path_), CorruptIndexError);
}

TEST_F(ChunkIndexTest, FailedLoadLeavesIndexUnchanged) {
  populate();
  TestUtilities::write_file(index_path_, "garbage");

  EXPECT_THROW(index_->load(index_path_), CorruptIndexError);
  EXPECT_EQ(index_->size(), 3u);
  EXPECT_EQ(index_->search(TestUtilities::one_hot(kDimension, 0), 1).at(0).chunk_id, 0);
}

TEST_F(ChunkIndexTest, ClearEmptiesEverything) {
  populate();
  index_->clear();

  EXPECT_EQ(index_->size(), 0u);
  EXPECT_EQ(index_->document_count(), 0u);
  EXPECT_TRUE(index_->search(TestUtilities::one_hot(kDimension, 0), 3).empty());
}

TEST_F(ChunkIndexTest, ConcurrentSearchesSeeConsistentChunks) {
  constexpr int kReaders = 4;
  constexpr int kRounds = 200;
  populate();
  auto churn_text = [](ChunkId id) { return "Churn chunk " + std::to_string(id) + "."; };
  auto expected_document = [](ChunkId id) -> std::string {
    if (id >= 100) {
      return "churn.txt";
    }
    return id == 2 ? "b.md" : "a.txt";
  };

  std::atomic<bool> writing{true};
  std::atomic<int> inconsistent{0};
  std::atomic<int> searches{0};

  std::thread writer([&] {
    for (int round = 0; round < kRounds; ++round) {
      for (size_t axis = 3; axis < kDimension; ++axis) {
        const ChunkId id = 100 + static_cast<ChunkId>(axis);
        index_->add(TestUtilities::make_chunk(id, "churn.txt", churn_text(id)),
                    TestUtilities::one_hot(kDimension, axis));
      }
      index_->remove_document("churn.txt");
    }
    writing = false;
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < kReaders; ++r) {
    readers.emplace_back([&, r] {
      size_t axis = static_cast<size_t>(r);
      do {
        auto results = index_->search(TestUtilities::one_hot(kDimension, axis % kDimension),
                                      kDimension);
        ++searches;
        for (size_t i = 0; i < results.size(); ++i) {
          const auto &result = results[i];
          if (result.source != ResultSource::Local || result.text.empty() ||
              result.attribution != expected_document(result.chunk_id) ||
              (result.chunk_id >= 100 && result.text != churn_text(result.chunk_id)) ||
              (i > 0 && results[i - 1].score < result.score)) {
            ++inconsistent;
          }
        }
        ++axis;
      } while (writing);
    });
  }

  writer.join();
  for (auto &reader : readers) {
    reader.join();
  }

  EXPECT_EQ(inconsistent.load(), 0);
  EXPECT_GE(searches.load(), kReaders);
  EXPECT_EQ(index_->size(), 3u);
  EXPECT_EQ(index_->document_count(), 2u);
  EXPECT_FALSE(index_->chunk(103).has_value());
}

}  // namespace scribe_tests
