#include "lore_core/llm/provider_factory.hpp"

#include "lore_core/errors.hpp"
#include "lore_core/llm/ollama_client.hpp"
#include "lore_core/llm/openai_client.hpp"

namespace lore_core {

namespace {

template <typename Capability>
std::shared_ptr<Capability> create_base_provider(const ProviderSettings &settings) {
  if (settings.provider == "ollama") {
    return std::make_shared<OllamaClient>(settings);
  }
  if (settings.provider == "openai") {
    return std::make_shared<OpenAIClient>(settings);
  }
  throw InvalidConfiguration("Unknown provider '" + settings.provider +
                             "'. Expected \"ollama\" or \"openai\"");
}

}  // namespace

std::shared_ptr<EmbeddingProvider> create_embedding_provider(const ProviderSettings &settings,
                                                             const RetryPolicy &retry_policy) {
  return std::make_shared<RetryingEmbeddingProvider>(
      create_base_provider<EmbeddingProvider>(settings), retry_policy);
}

std::shared_ptr<GenerationProvider> create_generation_provider(const ProviderSettings &settings,
                                                               const RetryPolicy &retry_policy) {
  return std::make_shared<RetryingGenerationProvider>(
      create_base_provider<GenerationProvider>(settings), retry_policy);
}

}  // namespace lore_core
