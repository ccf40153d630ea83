#pragma once

#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lore_core/chunker.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/service_provider.hpp"

namespace lore_core {

struct IngestReport {
  std::string source;
  // SHA-256 of the raw file, only set by ingest_file
  std::string content_hash;
  size_t total_chunks = 0;
  std::vector<std::string> stored_chunk_ids;
  // 0-based index of the chunk whose embedding or insertion failed
  std::optional<int> failed_chunk_index;

  size_t stored_count() const {
    return stored_chunk_ids.size();
  }
  bool complete() const {
    return !failed_chunk_index.has_value() && stored_chunk_ids.size() == total_chunks;
  }
};

/**
 * @brief A document was only partially ingested.
 *
 * Chunks listed in report().stored_chunk_ids stay in the store; nothing is rolled back.
 * cause() holds the original ProviderFailure, DimensionMismatch or StoreError.
 */
class IngestionError : public LoreError {
 public:
  IngestionError(const std::string &message, IngestReport report, std::exception_ptr cause)
      : LoreError(message), report_(std::move(report)), cause_(std::move(cause)) {}

  const IngestReport &report() const {
    return report_;
  }
  std::exception_ptr cause() const {
    return cause_;
  }
  [[noreturn]] void rethrow_cause() const {
    std::rethrow_exception(cause_);
  }

 private:
  IngestReport report_;
  std::exception_ptr cause_;
};

struct PipelineOptions {
  int chunk_size = 1000;
  int chunk_overlap = 200;
  // Embedding calls issued at once for one document; 1 keeps ingestion strictly sequential
  size_t embedding_concurrency = 1;
};

/**
 * @class DocumentPipeline
 * @brief Chunks a document, embeds every chunk and appends the results to the store.
 *
 * Chunk ids and indices are fixed before the first embedding call. The first failing
 * chunk (in index order) stops the document: later chunks are never inserted, and with
 * sequential embedding never embedded either.
 */
class DocumentPipeline {
 public:
  // @throw InvalidConfiguration for bad chunking parameters
  DocumentPipeline(std::shared_ptr<ServiceProvider> services, PipelineOptions options = {});

  /**
   * @brief Ingests one document's text under the given source id.
   *
   * @throw StoreError if chunks of this source are already stored (before any provider call).
   * @throw IngestionError if a chunk fails partway through.
   */
  IngestReport ingest(const std::string &source_id, const std::string &text);

  /**
   * @brief Extracts a file and ingests it with its path as source id.
   *
   * @throw UnsupportedFormat, ExtractionFailed from the extractor.
   */
  IngestReport ingest_file(const std::filesystem::path &file_path);

  const PipelineOptions &options() const {
    return options_;
  }

 private:
  [[noreturn]] void abort_ingestion(IngestReport &report, int chunk_index,
                                    std::exception_ptr cause) const;
  std::vector<std::exception_ptr> embed_window(const std::vector<Chunk> &chunks, size_t begin,
                                               size_t end, std::vector<Embedding> &out);

  std::shared_ptr<ServiceProvider> services_;
  PipelineOptions options_;
  Chunker chunker_;
};

}  // namespace lore_core
