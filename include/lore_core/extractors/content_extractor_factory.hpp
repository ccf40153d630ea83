#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include "content_extractor.hpp"

namespace lore_core {

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a given file type.
 *
 * Holds every registered extractor and selects one based on the file's extension. PDF and
 * Word documents are recognised but have no registered extractor: converting them to
 * text is the job of an external tool. This class is non-copyable and non-movable.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Finds and returns the extractor for the given file.
   *
   * @param file_path The path to the file that needs to be processed.
   * @return A constant reference to the appropriate ContentExtractor.
   * @throw UnsupportedFormat if no registered extractor handles the file.
   */
  virtual const ContentExtractor& get_extractor_for(const std::filesystem::path& file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};

}  // namespace lore_core
