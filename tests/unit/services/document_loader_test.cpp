#include <gtest/gtest.h>

#include "scribe_core/services/document_loader.hpp"
#include "utilities_test.hpp"

namespace scribe_tests {

using namespace scribe_core;

class DocumentLoaderTest : public TempDirTestBase {};

TEST_F(DocumentLoaderTest, HandlesTextAndMarkdownOnly) {
  DocumentLoader loader;
  EXPECT_TRUE(loader.can_handle("notes.txt"));
  EXPECT_TRUE(loader.can_handle("dir/readme.md"));
  EXPECT_FALSE(loader.can_handle("paper.pdf"));
  EXPECT_FALSE(loader.can_handle("Makefile"));
}

TEST_F(DocumentLoaderTest, LoadsFileWithFilenameAsDefaultId) {
  TestUtilities::write_file(temp_dir_ / "essay.md", "# Title\n\nBody text.");
  DocumentLoader loader;

  Document document = loader.load(temp_dir_ / "essay.md");

  EXPECT_EQ(document.document_id, "essay.md");
  EXPECT_EQ(document.raw_text, "# Title\n\nBody text.");
}

TEST_F(DocumentLoaderTest, UsesGivenDocumentId) {
  TestUtilities::write_file(temp_dir_ / "a.txt", "content");
  DocumentLoader loader;

  EXPECT_EQ(loader.load(temp_dir_ / "a.txt", "custom/id").document_id, "custom/id");
}

TEST_F(DocumentLoaderTest, ReplacesInvalidUtf8) {
  TestUtilities::write_file(temp_dir_ / "bad.txt", std::string("ok \xFF end"));
  DocumentLoader loader;

  Document document = loader.load(temp_dir_ / "bad.txt");

  EXPECT_EQ(document.raw_text, "ok \xEF\xBF\xBD end");
}

TEST_F(DocumentLoaderTest, LoadErrors) {
  TestUtilities::write_file(temp_dir_ / "image.png", "png");
  DocumentLoader loader;

  EXPECT_THROW(loader.load(temp_dir_ / "image.png"), IngestionError);
  EXPECT_THROW(loader.load(temp_dir_ / "missing.txt"), IngestionError);
}

TEST_F(DocumentLoaderTest, ListsSupportedFilesSorted) {
  TestUtilities::write_file(temp_dir_ / "b.txt", "b");
  TestUtilities::write_file(temp_dir_ / "a.md", "a");
  TestUtilities::write_file(temp_dir_ / "c.pdf", "c");
  TestUtilities::write_file(temp_dir_ / "sub" / "d.txt", "d");

  auto flat = DocumentLoader(false).list(temp_dir_);
  ASSERT_EQ(flat.size(), 2u);
  EXPECT_EQ(flat[0].filename(), "a.md");
  EXPECT_EQ(flat[1].filename(), "b.txt");

  auto recursive = DocumentLoader(true).list(temp_dir_);
  EXPECT_EQ(recursive.size(), 3u);
}

TEST_F(DocumentLoaderTest, ListingMissingFolderThrows) {
  EXPECT_THROW(DocumentLoader().list(temp_dir_ / "nope"), IngestionError);
}

}  // namespace scribe_tests
