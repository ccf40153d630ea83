#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "lore_core/llm/embedding_provider.hpp"
#include "lore_core/llm/generation_provider.hpp"
#include "lore_core/llm/provider_settings.hpp"

class Ollama;

namespace lore_core {

/**
 * @brief Maps an ollama-hpp failure message onto the provider error taxonomy.
 *
 * Connection failures and error replies surface from ollama-hpp as the same exception type.
 * A busy or throttling server becomes RateLimited and a missing reply ProviderUnavailable.
 * For any other message `is_running` decides between ProviderUnavailable and ProviderError.
 */
[[noreturn]] void throw_classified_ollama_failure(const std::string &operation,
                                                  const std::string &detail,
                                                  const std::string &endpoint,
                                                  const std::function<bool()> &is_running);

/**
 * @class OllamaClient
 * @brief Local-model provider backed by an Ollama server through ollama-hpp.
 *
 * One client talks to one server with one model; build one per role when embedding and
 * generation use different models.
 */
class OllamaClient : public EmbeddingProvider, public GenerationProvider {
 public:
  static constexpr const char *DEFAULT_ENDPOINT = "http://localhost:11434";

  explicit OllamaClient(ProviderSettings settings);
  ~OllamaClient() override;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  Embedding embed(const std::string &text) override;
  std::string generate(const std::string &prompt) override;

  // False when the server cannot be reached, never throws
  bool is_server_available();

  const std::string &model() const {
    return settings_.model;
  }

 private:
  [[noreturn]] void rethrow_classified(const std::string &operation, const std::string &detail);

  ProviderSettings settings_;
  std::unique_ptr<Ollama> server_;
};

}  // namespace lore_core
