#include "lore_core/llm/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace lore_core {

void default_sleeper(std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
}

std::chrono::milliseconds RetryPolicy::delay_for(int retry) const {
  const double scaled =
      static_cast<double>(initial_backoff.count()) * std::pow(multiplier, std::max(0, retry - 1));
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds(static_cast<long long>(capped));
}

void RetryPolicy::validate() const {
  if (max_attempts < 1) {
    throw InvalidConfiguration("retry max_attempts must be at least 1");
  }
  if (initial_backoff.count() < 0 || max_backoff.count() < 0) {
    throw InvalidConfiguration("retry backoff cannot be negative");
  }
  if (multiplier < 1.0) {
    throw InvalidConfiguration("retry multiplier must be at least 1.0");
  }
}

RetryingEmbeddingProvider::RetryingEmbeddingProvider(std::shared_ptr<EmbeddingProvider> inner,
                                                     RetryPolicy policy, Sleeper sleeper)
    : inner_(std::move(inner)), policy_(policy), sleeper_(std::move(sleeper)) {
  policy_.validate();
}

Embedding RetryingEmbeddingProvider::embed(const std::string &text) {
  return call_with_retry(policy_, sleeper_, [&] { return inner_->embed(text); });
}

RetryingGenerationProvider::RetryingGenerationProvider(std::shared_ptr<GenerationProvider> inner,
                                                       RetryPolicy policy, Sleeper sleeper)
    : inner_(std::move(inner)), policy_(policy), sleeper_(std::move(sleeper)) {
  policy_.validate();
}

std::string RetryingGenerationProvider::generate(const std::string &prompt) {
  return call_with_retry(policy_, sleeper_, [&] { return inner_->generate(prompt); });
}

}  // namespace lore_core
