#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/extractors/plaintext_extractor.hpp"

namespace lore_core {

using lore_tests::TestUtilities;

class PlainTextExtractorTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const auto& dir : created_dirs_) {
      TestUtilities::cleanup_temp_path(dir);
    }
  }

  std::filesystem::path create_test_file(const std::string& name, const std::string& content) {
    std::filesystem::path file = TestUtilities::write_temp_file(name, content);
    created_dirs_.push_back(file.parent_path());
    return file;
  }

  PlainTextExtractor extractor_;
  std::vector<std::filesystem::path> created_dirs_;
};

TEST_F(PlainTextExtractorTest, CanHandleTextFiles) {
  EXPECT_TRUE(extractor_.can_handle("notes.txt"));
  EXPECT_TRUE(extractor_.can_handle("/var/log/app.LOG"));
  EXPECT_FALSE(extractor_.can_handle("README.md"));
  EXPECT_FALSE(extractor_.can_handle("paper.pdf"));
  EXPECT_EQ(extractor_.get_file_type(), FileType::Text);
}

TEST_F(PlainTextExtractorTest, ExtractsTextAndHash) {
  auto file = create_test_file("hello.txt", "hello world");
  ExtractionResult result = extractor_.extract(file);

  EXPECT_EQ(result.text, "hello world");
  EXPECT_EQ(result.file_type, FileType::Text);
  // sha256("hello world")
  EXPECT_EQ(result.content_hash,
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
  EXPECT_EQ(extractor_.get_content_hash(file), result.content_hash);
}

TEST_F(PlainTextExtractorTest, NormalizesWindowsLineEndings) {
  auto file = create_test_file("crlf.txt", "line one\r\nline two\r\n");
  EXPECT_EQ(extractor_.extract(file).text, "line one\nline two\n");
}

TEST_F(PlainTextExtractorTest, RejectsInvalidUtf8) {
  auto file = create_test_file("binary.txt", std::string("ok") + '\xC3' + '(' + "rest");
  EXPECT_THROW(extractor_.extract(file), ExtractionFailed);
}

TEST_F(PlainTextExtractorTest, MissingFileFailsExtraction) {
  EXPECT_THROW(extractor_.extract("/nonexistent/dir/missing.txt"), ExtractionFailed);
}

}  // namespace lore_core
