#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "lore_core/errors.hpp"
#include "lore_core/llm/embedding_provider.hpp"
#include "lore_core/llm/generation_provider.hpp"

namespace lore_core {

using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Sleeps the calling thread.
void default_sleeper(std::chrono::milliseconds delay);

/**
 * @brief Exponential backoff for RateLimited provider responses.
 *
 * Only RateLimited is retried. Every other failure propagates on the first occurrence.
 */
struct RetryPolicy {
  int max_attempts = 4;
  std::chrono::milliseconds initial_backoff{250};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{8000};

  // Delay before retry number `retry` (1 for the first retry).
  std::chrono::milliseconds delay_for(int retry) const;

  // @throw InvalidConfiguration
  void validate() const;
};

/**
 * @brief Runs fn, retrying while it throws RateLimited.
 *
 * A Retry-After hint from the provider lengthens the computed delay but never past
 * max_backoff. Once max_attempts calls have been rate limited the failure becomes a
 * terminal ProviderUnavailable.
 */
template <typename Fn>
auto call_with_retry(const RetryPolicy &policy, const Sleeper &sleep, Fn &&fn) -> decltype(fn()) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const RateLimited &e) {
      if (attempt >= policy.max_attempts) {
        throw ProviderUnavailable("Provider still rate limited after " + std::to_string(attempt) +
                                  " attempt(s): " + e.what());
      }
      std::chrono::milliseconds delay = policy.delay_for(attempt);
      if (e.retry_after() && *e.retry_after() > delay) {
        delay = std::min(*e.retry_after(), policy.max_backoff);
      }
      sleep(delay);
    }
  }
}

class RetryingEmbeddingProvider : public EmbeddingProvider {
 public:
  RetryingEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner, RetryPolicy policy,
                            Sleeper sleeper = default_sleeper);

  Embedding embed(const std::string &text) override;

 private:
  std::shared_ptr<EmbeddingProvider> inner_;
  RetryPolicy policy_;
  Sleeper sleeper_;
};

class RetryingGenerationProvider : public GenerationProvider {
 public:
  RetryingGenerationProvider(std::shared_ptr<GenerationProvider> inner, RetryPolicy policy,
                             Sleeper sleeper = default_sleeper);

  std::string generate(const std::string &prompt) override;

 private:
  std::shared_ptr<GenerationProvider> inner_;
  RetryPolicy policy_;
  Sleeper sleeper_;
};

}  // namespace lore_core
