#pragma once

#include <memory>

#include "lore_core/llm/embedding_provider.hpp"
#include "lore_core/llm/generation_provider.hpp"
#include "lore_core/llm/provider_settings.hpp"
#include "lore_core/llm/retry_policy.hpp"

namespace lore_core {

/**
 * @brief Builds the provider named by settings.provider and wraps it in the retry decorator.
 *
 * @throw InvalidConfiguration for an unknown provider name or missing model.
 */
std::shared_ptr<EmbeddingProvider> create_embedding_provider(const ProviderSettings &settings,
                                                             const RetryPolicy &retry_policy);

std::shared_ptr<GenerationProvider> create_generation_provider(const ProviderSettings &settings,
                                                               const RetryPolicy &retry_policy);

}  // namespace lore_core
