#pragma once

#include <chrono>
#include <string>

namespace lore_core {

struct ProviderSettings {
  // "ollama" for a local model server, "openai" for an OpenAI-compatible hosted API
  std::string provider = "ollama";
  std::string endpoint;
  std::string model;
  std::string api_key;
  std::chrono::milliseconds timeout{30000};
};

}  // namespace lore_core
