#include "lore_core/services/answer_composer.hpp"

#include <sstream>

#include "lore_core/errors.hpp"

namespace lore_core {

namespace {

constexpr const char *GROUNDED_INSTRUCTIONS =
    "You are a helpful assistant. Answer the question using only the context below. "
    "If the context does not contain the answer, say that you do not know.";

constexpr const char *NO_CONTEXT_INSTRUCTIONS =
    "You are a helpful assistant. No relevant context was found in the document store for "
    "this question. Tell the user that the indexed documents do not contain relevant "
    "information.";

}  // namespace

AnswerComposer::AnswerComposer(std::shared_ptr<GenerationProvider> generator)
    : generator_(std::move(generator)) {
  if (!generator_) {
    throw InvalidConfiguration("AnswerComposer requires a generation provider");
  }
}

std::string AnswerComposer::compose(const std::string &query, const RetrievalResult &retrieved) {
  std::ostringstream prompt;

  if (retrieved.empty()) {
    prompt << NO_CONTEXT_INSTRUCTIONS << "\n\n"
           << "Context:\n(no context found)\n\n"
           << "Question: " << query << "\n"
           << "Answer:";
    return prompt.str();
  }

  prompt << GROUNDED_INSTRUCTIONS << "\n\n"
         << "Context:";
  for (size_t i = 0; i < retrieved.size(); ++i) {
    const Chunk &chunk = retrieved[i].chunk;
    prompt << (i == 0 ? "\n" : CONTEXT_DELIMITER) << "[Source: " << chunk.metadata.source << "]\n"
           << chunk.content;
  }
  prompt << "\n\n"
         << "Question: " << query << "\n"
         << "Answer:";
  return prompt.str();
}

std::string AnswerComposer::generate(const std::string &prompt) {
  return generator_->generate(prompt);
}

std::string AnswerComposer::answer(const std::string &query, const RetrievalResult &retrieved) {
  return generate(compose(query, retrieved));
}

}  // namespace lore_core
