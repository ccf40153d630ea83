#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "lore_core/types/file.hpp"

namespace fs = std::filesystem;

namespace lore_core {

struct ExtractionResult {
  std::string text;
  std::string content_hash;
  FileType file_type = FileType::Unknown;
};

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given file extension
  virtual bool can_handle(const fs::path& file_path) const = 0;

  /**
   * @brief Reads the file and returns its plain text together with a SHA-256 content hash.
   * @throw ExtractionFailed if the file cannot be read or is not valid UTF-8.
   */
  virtual ExtractionResult extract(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

  std::string get_content_hash(const fs::path& file_path) const;

 protected:
  std::string get_string_content(const fs::path& file_path) const;
  std::string compute_hash_from_content(const std::string& content) const;
  void ensure_valid_utf8(const std::string& content, const fs::path& file_path) const;
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace lore_core
