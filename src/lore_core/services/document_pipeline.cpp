#include "lore_core/services/document_pipeline.hpp"

#include <algorithm>
#include <future>
#include <iostream>

#include "lore_core/extractors/content_extractor_factory.hpp"
#include "lore_core/llm/embedding_provider.hpp"
#include "lore_core/store/document_store.hpp"

namespace lore_core {

namespace {

std::string describe(const std::exception_ptr &cause) {
  try {
    std::rethrow_exception(cause);
  } catch (const std::exception &e) {
    return e.what();
  }
}

}  // namespace

DocumentPipeline::DocumentPipeline(std::shared_ptr<ServiceProvider> services, PipelineOptions options)
    : services_(std::move(services)),
      options_(options),
      chunker_(options.chunk_size, options.chunk_overlap) {
  if (!services_) {
    throw InvalidConfiguration("DocumentPipeline requires a service provider");
  }
  if (options_.embedding_concurrency == 0) {
    throw InvalidConfiguration("embedding_concurrency must be at least 1");
  }
}

IngestReport DocumentPipeline::ingest(const std::string &source_id, const std::string &text) {
  if (source_id.empty()) {
    throw InvalidConfiguration("source id cannot be empty");
  }

  DocumentStore &store = services_->get_document_store();
  if (store.find(make_chunk_id(source_id, 0))) {
    throw StoreError("Source '" + source_id + "' has already been ingested");
  }

  std::vector<Chunk> chunks = chunker_.to_chunks(source_id, text);

  IngestReport report;
  report.source = source_id;
  report.total_chunks = chunks.size();
  report.stored_chunk_ids.reserve(chunks.size());

  const size_t window = options_.embedding_concurrency;
  for (size_t begin = 0; begin < chunks.size(); begin += window) {
    const size_t end = std::min(begin + window, chunks.size());
    std::vector<Embedding> embeddings;
    std::vector<std::exception_ptr> failures = embed_window(chunks, begin, end, embeddings);

    for (size_t i = begin; i < end; ++i) {
      const int chunk_index = chunks[i].metadata.chunk_index;
      if (failures[i - begin]) {
        abort_ingestion(report, chunk_index, failures[i - begin]);
      }
      const std::string chunk_id = chunks[i].id;
      try {
        store.insert(std::move(chunks[i]), std::move(embeddings[i - begin]));
      } catch (const LoreError &) {
        abort_ingestion(report, chunk_index, std::current_exception());
      }
      report.stored_chunk_ids.push_back(chunk_id);
    }
  }

  std::cout << "[Pipeline] Ingested " << report.stored_count() << " chunk(s) from " << source_id
            << std::endl;
  return report;
}

std::vector<std::exception_ptr> DocumentPipeline::embed_window(const std::vector<Chunk> &chunks,
                                                               size_t begin, size_t end,
                                                               std::vector<Embedding> &out) {
  EmbeddingProvider &embedder = services_->get_embedding_provider();
  const size_t count = end - begin;
  out.assign(count, Embedding{});
  std::vector<std::exception_ptr> failures(count);

  if (count == 1) {
    try {
      out[0] = embedder.embed(chunks[begin].content);
    } catch (const std::exception &) {
      failures[0] = std::current_exception();
    }
    return failures;
  }

  std::vector<std::future<Embedding>> pending;
  pending.reserve(count);
  for (size_t i = begin; i < end; ++i) {
    const std::string &content = chunks[i].content;
    pending.push_back(
        std::async(std::launch::async, [&embedder, &content] { return embedder.embed(content); }));
  }
  for (size_t i = 0; i < count; ++i) {
    try {
      out[i] = pending[i].get();
    } catch (const std::exception &) {
      failures[i] = std::current_exception();
    }
  }
  return failures;
}

void DocumentPipeline::abort_ingestion(IngestReport &report, int chunk_index,
                                       std::exception_ptr cause) const {
  report.failed_chunk_index = chunk_index;
  const std::string message = "Ingestion of '" + report.source + "' aborted at chunk " +
                              std::to_string(chunk_index + 1) + " of " +
                              std::to_string(report.total_chunks) + " after storing " +
                              std::to_string(report.stored_count()) +
                              " chunk(s): " + describe(cause);
  std::cerr << "[Pipeline] " << message << std::endl;
  throw IngestionError(message, report, std::move(cause));
}

IngestReport DocumentPipeline::ingest_file(const std::filesystem::path &file_path) {
  const ContentExtractor &extractor = services_->get_extractor_factory().get_extractor_for(file_path);
  ExtractionResult extraction = extractor.extract(file_path);

  IngestReport report = ingest(file_path.string(), extraction.text);
  report.content_hash = extraction.content_hash;
  return report;
}

}  // namespace lore_core
