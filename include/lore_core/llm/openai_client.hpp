#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "lore_core/llm/embedding_provider.hpp"
#include "lore_core/llm/generation_provider.hpp"
#include "lore_core/llm/http_transport.hpp"
#include "lore_core/llm/provider_settings.hpp"

namespace lore_core {

// Delay-seconds form of Retry-After, capped at one hour. Dates, negative and NaN values
// give no hint.
std::optional<std::chrono::milliseconds> parse_retry_after(const std::string &value);

/**
 * @class OpenAIClient
 * @brief Hosted-API provider speaking the OpenAI-compatible REST protocol.
 *
 * Embeddings go to <endpoint>/embeddings and completions to <endpoint>/chat/completions.
 * HTTP 429 is reported as RateLimited (with the Retry-After hint when present), gateway
 * and timeout statuses as ProviderUnavailable, and everything else that is not a usable
 * 2xx answer as ProviderError.
 */
class OpenAIClient : public EmbeddingProvider, public GenerationProvider {
 public:
  static constexpr const char *DEFAULT_ENDPOINT = "https://api.openai.com/v1";

  explicit OpenAIClient(ProviderSettings settings,
                        std::shared_ptr<HttpTransport> transport = std::make_shared<CurlTransport>());

  OpenAIClient(const OpenAIClient &) = delete;
  OpenAIClient &operator=(const OpenAIClient &) = delete;

  Embedding embed(const std::string &text) override;
  std::string generate(const std::string &prompt) override;

 private:
  nlohmann::json post_json(const std::string &path, const nlohmann::json &body);
  [[noreturn]] void raise_for_status(const HttpResponse &response, const std::string &url) const;

  ProviderSettings settings_;
  std::shared_ptr<HttpTransport> transport_;
};

}  // namespace lore_core
