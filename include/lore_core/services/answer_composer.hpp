#pragma once

#include <memory>
#include <string>

#include "lore_core/llm/generation_provider.hpp"
#include "lore_core/types/retrieval.hpp"

namespace lore_core {

/**
 * @class AnswerComposer
 * @brief Turns a question plus retrieved chunks into a grounded prompt and asks the
 * generation provider to answer it.
 *
 * An empty retrieval result is a valid input: the prompt then tells the model that no
 * context was found, so the model can say so instead of guessing.
 */
class AnswerComposer {
 public:
  static constexpr const char *CONTEXT_DELIMITER = "\n-----\n";

  explicit AnswerComposer(std::shared_ptr<GenerationProvider> generator);

  static std::string compose(const std::string &query, const RetrievalResult &retrieved);

  // Provider failures propagate unchanged.
  std::string generate(const std::string &prompt);

  std::string answer(const std::string &query, const RetrievalResult &retrieved);

 private:
  std::shared_ptr<GenerationProvider> generator_;
};

}  // namespace lore_core
