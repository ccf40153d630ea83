#pragma once

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "lore_core/llm/provider_settings.hpp"
#include "lore_core/llm/retry_policy.hpp"
#include "lore_core/services/document_pipeline.hpp"
#include "lore_core/services/retriever.hpp"

class Config {
 public:
  static constexpr const char *DEFAULT_FILE = "lorerc.json";
  static constexpr const char *FILE_ENV_VAR = "LORE_CONFIG";

  std::string api_base_url;
  // Empty disables snapshot persistence
  std::string snapshot_path;

  int chunk_size;
  int chunk_overlap;
  int top_k;
  int embedding_concurrency;
  std::string retrieval_index;
  int candidate_multiplier;

  int request_timeout_ms;
  int retry_max_attempts;
  int retry_initial_backoff_ms;
  int retry_max_backoff_ms;

  lore_core::ProviderSettings embedding;
  lore_core::ProviderSettings generation;

  // $LORE_CONFIG when set, lorerc.json otherwise
  static std::string default_path() {
    const char *from_env = std::getenv(FILE_ENV_VAR);
    return (from_env && *from_env) ? std::string(from_env) : std::string(DEFAULT_FILE);
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    Config config;

    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.snapshot_path = json_config.value("snapshot_path", std::string("./data/lore.db"));

      config.chunk_size = json_config.value("chunk_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.top_k = json_config.value("top_k", 4);
      config.embedding_concurrency = json_config.value("embedding_concurrency", 1);
      config.retrieval_index = json_config.value("retrieval_index", std::string("exact"));
      config.candidate_multiplier = json_config.value("candidate_multiplier", 4);

      config.request_timeout_ms = json_config.value("request_timeout_ms", 30000);
      config.retry_max_attempts = json_config.value("retry_max_attempts", 4);
      config.retry_initial_backoff_ms = json_config.value("retry_initial_backoff_ms", 250);
      config.retry_max_backoff_ms = json_config.value("retry_max_backoff_ms", 8000);

      config.embedding = provider_from_json(json_config.value("embedding", nlohmann::json::object()),
                                            "mxbai-embed-large", config.request_timeout_ms);
      config.generation = provider_from_json(
          json_config.value("generation", nlohmann::json::object()), "llama3.2",
          config.request_timeout_ms);
    } catch (const nlohmann::json::exception &e) {
      throw std::runtime_error(std::string("Invalid value in configuration: ") + e.what());
    }

    config.validate();
    return config;
  }

  lore_core::RetryPolicy retry_policy() const {
    lore_core::RetryPolicy policy;
    policy.max_attempts = retry_max_attempts;
    policy.initial_backoff = std::chrono::milliseconds(retry_initial_backoff_ms);
    policy.max_backoff = std::chrono::milliseconds(retry_max_backoff_ms);
    return policy;
  }

  lore_core::PipelineOptions pipeline_options() const {
    lore_core::PipelineOptions options;
    options.chunk_size = chunk_size;
    options.chunk_overlap = chunk_overlap;
    options.embedding_concurrency = static_cast<size_t>(embedding_concurrency);
    return options;
  }

  lore_core::RetrieverOptions retriever_options() const {
    lore_core::RetrieverOptions options;
    options.index = lore_core::index_kind_from_string(retrieval_index);
    options.candidate_multiplier = static_cast<size_t>(candidate_multiplier);
    return options;
  }

 private:
  static lore_core::ProviderSettings provider_from_json(const nlohmann::json &json_provider,
                                                       const std::string &default_model,
                                                       int timeout_ms) {
    lore_core::ProviderSettings settings;
    settings.provider = json_provider.value("provider", std::string("ollama"));
    settings.endpoint = json_provider.value("endpoint", std::string());
    settings.model = json_provider.value("model", default_model);
    settings.timeout = std::chrono::milliseconds(timeout_ms);

    // Keys never live in the file, only the name of the variable holding one
    const std::string api_key_env = json_provider.value("api_key_env", std::string());
    if (!api_key_env.empty()) {
      const char *key = std::getenv(api_key_env.c_str());
      if (key == nullptr || *key == '\0') {
        throw std::runtime_error("Environment variable " + api_key_env +
                                 " named by api_key_env is not set");
      }
      settings.api_key = key;
    }
    return settings;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and less than chunk_size");
    }
    if (top_k < 1) {
      throw std::runtime_error("top_k must be at least 1");
    }
    if (embedding_concurrency < 1) {
      throw std::runtime_error("embedding_concurrency must be at least 1");
    }
    if (candidate_multiplier < 1) {
      throw std::runtime_error("candidate_multiplier must be at least 1");
    }
    if (retrieval_index != "exact" && retrieval_index != "faiss_flat" &&
        retrieval_index != "faiss_hnsw") {
      throw std::runtime_error("retrieval_index must be one of exact, faiss_flat, faiss_hnsw");
    }
    if (request_timeout_ms < 1) {
      throw std::runtime_error("request_timeout_ms must be greater than 0");
    }
    if (retry_max_attempts < 1) {
      throw std::runtime_error("retry_max_attempts must be at least 1");
    }
    if (retry_initial_backoff_ms < 0 || retry_max_backoff_ms < retry_initial_backoff_ms) {
      throw std::runtime_error("retry backoff must satisfy 0 <= initial <= max");
    }
    for (const lore_core::ProviderSettings *settings : {&embedding, &generation}) {
      if (settings->provider != "ollama" && settings->provider != "openai") {
        throw std::runtime_error("Unknown provider '" + settings->provider +
                                 "', expected ollama or openai");
      }
      if (settings->model.empty()) {
        throw std::runtime_error("Provider model cannot be empty");
      }
    }
  }
};
