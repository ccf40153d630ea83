#include "lore_core/service_provider.hpp"

#include "lore_core/errors.hpp"

namespace lore_core {

ServiceProvider::ServiceProvider(std::shared_ptr<DocumentStore> store,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 std::shared_ptr<GenerationProvider> generator,
                                 std::shared_ptr<ContentExtractorFactory> factory)
    : store_(std::move(store)),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      content_extractor_fac_(std::move(factory)) {
  if (!store_ || !embedder_ || !generator_ || !content_extractor_fac_) {
    throw InvalidConfiguration("ServiceProvider requires a store, both providers and an extractor factory");
  }
}

}  // namespace lore_core
