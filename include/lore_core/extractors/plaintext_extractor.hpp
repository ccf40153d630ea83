#pragma once

#include "content_extractor.hpp"

namespace lore_core {

class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const fs::path& file_path) const override;

  ExtractionResult extract(const fs::path& file_path) const override;

  FileType get_file_type() const override {
    return FileType::Text;
  }
};

}  // namespace lore_core
