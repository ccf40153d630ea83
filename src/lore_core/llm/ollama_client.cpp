#include "lore_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cctype>

#include "lore_core/errors.hpp"
#include "ollama.hpp"

namespace lore_core {

namespace {

bool mentions_throttling(std::string detail) {
  std::transform(detail.begin(), detail.end(), detail.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  // Ollama answers "server busy, please try again.  maximum pending requests exceeded"
  // when OLLAMA_MAX_QUEUE is full
  return detail.find("server busy") != std::string::npos ||
         detail.find("maximum pending requests") != std::string::npos ||
         detail.find("too many requests") != std::string::npos ||
         detail.find("429") != std::string::npos;
}

}  // namespace

void throw_classified_ollama_failure(const std::string &operation, const std::string &detail,
                                     const std::string &endpoint,
                                     const std::function<bool()> &is_running) {
  if (mentions_throttling(detail)) {
    throw RateLimited(operation + " throttled by Ollama server at " + endpoint + ": " + detail);
  }

  // ollama-hpp reports timeouts and dropped connections as "No response returned ..."
  if (detail.find("No response") != std::string::npos) {
    throw ProviderUnavailable(operation + " failed, no response from Ollama server at " +
                              endpoint + ": " + detail);
  }

  if (!is_running()) {
    throw ProviderUnavailable(operation + " failed, Ollama server at " + endpoint +
                              " is not reachable: " + detail);
  }
  throw ProviderError(operation + " failed: " + detail);
}

OllamaClient::OllamaClient(ProviderSettings settings) : settings_(std::move(settings)) {
  if (settings_.endpoint.empty()) {
    settings_.endpoint = DEFAULT_ENDPOINT;
  }
  if (settings_.model.empty()) {
    throw InvalidConfiguration("Ollama provider requires a model name");
  }
  server_ = std::make_unique<Ollama>(settings_.endpoint);

  // ollama-hpp takes whole seconds
  const int timeout_seconds =
      std::max(1, static_cast<int>((settings_.timeout.count() + 999) / 1000));
  server_->setReadTimeout(timeout_seconds);
  server_->setWriteTimeout(timeout_seconds);
}

OllamaClient::~OllamaClient() = default;

Embedding OllamaClient::embed(const std::string &text) {
  nlohmann::json json_response;
  try {
    ollama::response response = server_->generate_embeddings(settings_.model, text);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    rethrow_classified("Embedding generation", e.what());
  }

  if (!json_response.contains("embeddings")) {
    throw ProviderError("Response does not contain embedding field");
  }

  try {
    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw ProviderError("Embeddings field is not a non-empty array");
    }
    Embedding embedding = embeddings[0].is_array() ? embeddings[0].get<Embedding>()
                                                   : embeddings.get<Embedding>();
    if (embedding.empty()) {
      throw ProviderError("Received empty embedding from Ollama");
    }
    return embedding;
  } catch (const nlohmann::json::exception &e) {
    throw ProviderError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::string OllamaClient::generate(const std::string &prompt) {
  nlohmann::json json_response;
  try {
    ollama::response response = server_->generate(settings_.model, prompt);
    json_response = response.as_json();
  } catch (const ollama::exception &e) {
    rethrow_classified("Text generation", e.what());
  }

  if (!json_response.contains("response") || !json_response["response"].is_string()) {
    throw ProviderError("Generation response does not contain a response field");
  }
  return json_response["response"].get<std::string>();
}

bool OllamaClient::is_server_available() {
  try {
    return server_->is_running();
  } catch (const ollama::exception &) {
    return false;
  }
}

void OllamaClient::rethrow_classified(const std::string &operation, const std::string &detail) {
  throw_classified_ollama_failure(operation, detail, settings_.endpoint,
                                  [this] { return is_server_available(); });
}

}  // namespace lore_core
