#include "lore_core/llm/openai_client.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "lore_core/errors.hpp"

namespace lore_core {

namespace {

std::string excerpt(const std::string &body) {
  constexpr size_t MAX_EXCERPT = 200;
  if (body.size() <= MAX_EXCERPT) {
    return body;
  }
  return body.substr(0, MAX_EXCERPT) + "...";
}

}  // namespace

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string &value) {
  constexpr double MAX_RETRY_AFTER_SECONDS = 3600.0;
  double seconds = 0.0;
  try {
    seconds = std::stod(value);
  } catch (const std::invalid_argument &) {
    // HTTP-date form is not interpreted; the caller's backoff applies instead
    return std::nullopt;
  } catch (const std::out_of_range &) {
    seconds = value.find('-') == std::string::npos ? MAX_RETRY_AFTER_SECONDS : -1.0;
  }
  if (std::isnan(seconds) || seconds < 0.0) {
    return std::nullopt;
  }
  seconds = std::min(seconds, MAX_RETRY_AFTER_SECONDS);
  return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

OpenAIClient::OpenAIClient(ProviderSettings settings, std::shared_ptr<HttpTransport> transport)
    : settings_(std::move(settings)), transport_(std::move(transport)) {
  if (settings_.endpoint.empty()) {
    settings_.endpoint = DEFAULT_ENDPOINT;
  }
  while (!settings_.endpoint.empty() && settings_.endpoint.back() == '/') {
    settings_.endpoint.pop_back();
  }
  if (settings_.model.empty()) {
    throw InvalidConfiguration("OpenAI provider requires a model name");
  }
  if (!transport_) {
    throw InvalidConfiguration("OpenAI provider requires an HTTP transport");
  }
}

Embedding OpenAIClient::embed(const std::string &text) {
  nlohmann::json body = {{"model", settings_.model}, {"input", text}};
  nlohmann::json response = post_json("/embeddings", body);

  try {
    if (!response.contains("data") || !response["data"].is_array() || response["data"].empty()) {
      throw ProviderError("Embedding response does not contain a data array");
    }
    const auto &first = response["data"][0];
    if (!first.contains("embedding") || !first["embedding"].is_array()) {
      throw ProviderError("Embedding response does not contain an embedding field");
    }
    Embedding embedding = first["embedding"].get<Embedding>();
    if (embedding.empty()) {
      throw ProviderError("Embedding response contained an empty vector");
    }
    return embedding;
  } catch (const nlohmann::json::exception &e) {
    throw ProviderError("Malformed embedding response: " + std::string(e.what()));
  }
}

std::string OpenAIClient::generate(const std::string &prompt) {
  nlohmann::json body = {{"model", settings_.model},
                         {"messages", nlohmann::json::array({{{"role", "user"}, {"content", prompt}}})}};
  nlohmann::json response = post_json("/chat/completions", body);

  try {
    if (!response.contains("choices") || !response["choices"].is_array() ||
        response["choices"].empty()) {
      throw ProviderError("Completion response does not contain any choices");
    }
    const auto &message = response["choices"][0].at("message");
    if (!message.contains("content") || !message["content"].is_string()) {
      throw ProviderError("Completion response does not contain message content");
    }
    return message["content"].get<std::string>();
  } catch (const nlohmann::json::exception &e) {
    throw ProviderError("Malformed completion response: " + std::string(e.what()));
  }
}

nlohmann::json OpenAIClient::post_json(const std::string &path, const nlohmann::json &body) {
  HttpRequest request;
  request.url = settings_.endpoint + path;
  request.headers.push_back("Content-Type: application/json");
  if (!settings_.api_key.empty()) {
    request.headers.push_back("Authorization: Bearer " + settings_.api_key);
  }
  request.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  request.timeout = settings_.timeout;

  HttpResponse response = transport_->post(request);
  if (response.status_code < 200 || response.status_code >= 300) {
    raise_for_status(response, request.url);
  }

  try {
    return nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &e) {
    throw ProviderError("Provider returned invalid JSON from " + request.url + ": " + e.what());
  }
}

void OpenAIClient::raise_for_status(const HttpResponse &response, const std::string &url) const {
  const std::string status = std::to_string(response.status_code);
  switch (response.status_code) {
    case 429: {
      std::optional<std::chrono::milliseconds> retry_after;
      auto it = response.headers.find("retry-after");
      if (it != response.headers.end()) {
        retry_after = parse_retry_after(it->second);
      }
      throw RateLimited("Provider at " + url + " is rate limiting requests", retry_after);
    }
    case 408:
    case 502:
    case 503:
    case 504:
      throw ProviderUnavailable("Provider at " + url + " is unavailable (HTTP " + status + ")");
    default:
      throw ProviderError("Provider at " + url + " returned HTTP " + status + ": " +
                          excerpt(response.body));
  }
}

}  // namespace lore_core
