#pragma once

#include <string>

#include "content_extractor.hpp"

namespace lore_core {

class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  ExtractionResult extract(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Markdown;
  }

  // Strips YAML front matter and HTML comments; headings and body text are kept verbatim.
  static std::string strip_markup_noise(const std::string& content);
};

}  // namespace lore_core
