#include "lore_core/extractors/content_extractor_factory.hpp"

#include "lore_core/errors.hpp"
#include "lore_core/extractors/markdown_extractor.hpp"
#include "lore_core/extractors/plaintext_extractor.hpp"

namespace lore_core {

ContentExtractorFactory::ContentExtractorFactory() {
  extractors.push_back(std::make_unique<MarkdownExtractor>());
  extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path& file_path) const {
  for (const auto& extractor : extractors) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }

  const FileType type = file_type_from_path(file_path);
  if (type == FileType::PDF || type == FileType::Word) {
    throw UnsupportedFormat(to_string(type) + " documents must be converted to text before ingestion: " +
                            file_path.string());
  }
  throw UnsupportedFormat("No suitable content extractor found for " + file_path.string());
}

}  // namespace lore_core
