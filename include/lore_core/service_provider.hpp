#pragma once

#include <memory>

namespace lore_core {
class DocumentStore;
class EmbeddingProvider;
class GenerationProvider;
class ContentExtractorFactory;
}  // namespace lore_core

namespace lore_core {

/**
 * @class ServiceProvider
 * @brief The explicit context shared by the ingestion and query paths.
 *
 * Whoever builds the pipeline (the server, a test) owns the ServiceProvider and therefore
 * the lifetime of the document store; there is no global state.
 */
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<DocumentStore> store,
                  std::shared_ptr<EmbeddingProvider> embedder,
                  std::shared_ptr<GenerationProvider> generator,
                  std::shared_ptr<ContentExtractorFactory> factory);

  DocumentStore& get_document_store() {
    return *store_;
  }
  EmbeddingProvider& get_embedding_provider() {
    return *embedder_;
  }
  GenerationProvider& get_generation_provider() {
    return *generator_;
  }
  ContentExtractorFactory& get_extractor_factory() {
    return *content_extractor_fac_;
  }

  std::shared_ptr<DocumentStore> document_store_ptr() const {
    return store_;
  }
  std::shared_ptr<GenerationProvider> generation_provider_ptr() const {
    return generator_;
  }

 private:
  std::shared_ptr<DocumentStore> store_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::shared_ptr<GenerationProvider> generator_;
  std::shared_ptr<ContentExtractorFactory> content_extractor_fac_;
};

}  // namespace lore_core
