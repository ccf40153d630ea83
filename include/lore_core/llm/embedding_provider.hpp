#pragma once

#include <string>

#include "lore_core/types/chunk.hpp"

namespace lore_core {

/**
 * @brief Capability to turn one piece of text into a fixed-length vector.
 *
 * Implementations report failures with ProviderUnavailable, ProviderError or RateLimited
 * (see lore_core/errors.hpp). Callers own the retry policy.
 */
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual Embedding embed(const std::string &text) = 0;
};

}  // namespace lore_core
