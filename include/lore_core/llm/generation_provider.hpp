#pragma once

#include <string>

namespace lore_core {

// Capability to complete a prompt. Same failure contract as EmbeddingProvider.
class GenerationProvider {
 public:
  virtual ~GenerationProvider() = default;

  virtual std::string generate(const std::string &prompt) = 0;
};

}  // namespace lore_core
