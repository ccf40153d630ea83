#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lore_core/service_provider.hpp"
#include "lore_core/services/answer_composer.hpp"
#include "lore_core/services/retriever.hpp"
#include "lore_core/types/retrieval.hpp"

namespace lore_core {

struct Answer {
  std::string text;
  std::string prompt;
  // The chunks the prompt was built from, best first
  RetrievalResult sources;
};

/**
 * @class RagService
 * @brief Query side of the pipeline: embed the question, retrieve, compose, generate.
 */
class RagService {
 public:
  RagService(std::shared_ptr<ServiceProvider> services, RetrieverOptions retriever_options = {},
             int default_top_k = 4);

  // Without k the default top_k is used. @throw InvalidConfiguration if k < 1
  RetrievalResult search(const std::string &query, std::optional<int> k = std::nullopt);

  /**
   * @brief Answers a question from the stored documents.
   *
   * An empty store is not an error: the model is told no context was found.
   * @throw ProviderFailure from either provider, DimensionMismatch from retrieval.
   */
  Answer ask(const std::string &query, std::optional<int> k = std::nullopt);

  int default_top_k() const {
    return default_top_k_;
  }

 private:
  int resolve_k(std::optional<int> k) const;

  std::shared_ptr<ServiceProvider> services_;
  Retriever retriever_;
  AnswerComposer composer_;
  int default_top_k_;
};

}  // namespace lore_core
