#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "lore_core/errors.hpp"
#include "lore_core/extractors/content_extractor_factory.hpp"

namespace lore_core {

TEST(ContentExtractorFactoryTest, SelectsExtractorByExtension) {
  ContentExtractorFactory factory;
  EXPECT_EQ(factory.get_extractor_for("notes.txt").get_file_type(), FileType::Text);
  EXPECT_EQ(factory.get_extractor_for("README.md").get_file_type(), FileType::Markdown);
  EXPECT_EQ(factory.get_extractor_for("LOG.TXT").get_file_type(), FileType::Text);
}

TEST(ContentExtractorFactoryTest, PdfAndWordNeedConversion) {
  ContentExtractorFactory factory;
  try {
    factory.get_extractor_for("paper.pdf");
    FAIL() << "Expected UnsupportedFormat";
  } catch (const UnsupportedFormat& e) {
    EXPECT_THAT(e.what(), testing::HasSubstr("converted to text"));
  }
  EXPECT_THROW(factory.get_extractor_for("letter.docx"), UnsupportedFormat);
}

TEST(ContentExtractorFactoryTest, UnknownExtensionIsUnsupported) {
  ContentExtractorFactory factory;
  EXPECT_THROW(factory.get_extractor_for("photo.jpeg"), UnsupportedFormat);
  EXPECT_THROW(factory.get_extractor_for("no_extension"), UnsupportedFormat);
}

}  // namespace lore_core
