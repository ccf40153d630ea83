#include "lore_core/services/rag_service.hpp"

#include <iostream>

#include "lore_core/errors.hpp"
#include "lore_core/llm/embedding_provider.hpp"

namespace lore_core {

namespace {

std::shared_ptr<ServiceProvider> require(std::shared_ptr<ServiceProvider> services) {
  if (!services) {
    throw InvalidConfiguration("RagService requires a service provider");
  }
  return services;
}

}  // namespace

RagService::RagService(std::shared_ptr<ServiceProvider> services, RetrieverOptions retriever_options,
                       int default_top_k)
    : services_(require(std::move(services))),
      retriever_(services_->document_store_ptr(), retriever_options),
      composer_(services_->generation_provider_ptr()),
      default_top_k_(default_top_k) {
  if (default_top_k_ < 1) {
    throw InvalidConfiguration("top_k must be at least 1, got " + std::to_string(default_top_k_));
  }
}

int RagService::resolve_k(std::optional<int> k) const {
  return k.value_or(default_top_k_);
}

RetrievalResult RagService::search(const std::string &query, std::optional<int> k) {
  const int top_k = resolve_k(k);
  if (top_k < 1) {
    throw InvalidConfiguration("k must be at least 1, got " + std::to_string(top_k));
  }
  Embedding query_embedding = services_->get_embedding_provider().embed(query);
  return retriever_.retrieve(query_embedding, top_k);
}

Answer RagService::ask(const std::string &query, std::optional<int> k) {
  Answer answer;
  answer.sources = search(query, k);
  if (answer.sources.empty()) {
    std::cout << "[Query] No stored context for question, answering without it" << std::endl;
  }
  answer.prompt = AnswerComposer::compose(query, answer.sources);
  answer.text = composer_.generate(answer.prompt);
  return answer;
}

}  // namespace lore_core
