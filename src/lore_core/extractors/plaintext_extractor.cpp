#include "lore_core/extractors/plaintext_extractor.hpp"

namespace lore_core {

bool PlainTextExtractor::can_handle(const fs::path& file_path) const {
  return file_type_from_path(file_path) == FileType::Text;
}

/**
 * @brief Reads a plain text file.
 *
 * The hash is taken over the raw bytes; the returned text has Windows line endings
 * normalized to '\n' so the same document chunks identically on every platform.
 */
ExtractionResult PlainTextExtractor::extract(const fs::path& file_path) const {
  std::string content = get_string_content(file_path);
  ensure_valid_utf8(content, file_path);

  ExtractionResult result;
  result.content_hash = compute_hash_from_content(content);
  result.file_type = FileType::Text;

  result.text.reserve(content.size());
  for (size_t i = 0; i < content.size(); ++i) {
    if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
      continue;
    }
    result.text.push_back(content[i]);
  }
  return result;
}

}  // namespace lore_core
