#pragma once

#include <memory>

#include "lore_core/store/document_store.hpp"
#include "lore_core/store/faiss_index.hpp"
#include "lore_core/types/retrieval.hpp"

namespace lore_core {

struct RetrieverOptions {
  IndexKind index = IndexKind::Exact;
  // Indexed modes rescore k * candidate_multiplier candidates exactly
  size_t candidate_multiplier = 4;
};

/**
 * @class Retriever
 * @brief Ranks stored chunks by cosine similarity to a query embedding.
 *
 * Results are ordered by descending score; equal scores are ordered by ascending chunk
 * index and then by source. The exact mode scans every stored vector. The faiss modes only
 * rescore the candidates returned by the index, widening the pool while its worst candidate
 * still ties the k-th result. With faiss_hnsw a true neighbour can be missed.
 */
class Retriever {
 public:
  explicit Retriever(std::shared_ptr<const DocumentStore> store, RetrieverOptions options = {});

  /**
   * @brief Returns the min(k, store size) best-scoring chunks.
   *
   * @throw InvalidConfiguration if k < 1.
   * @throw DimensionMismatch if the store is non-empty and its dimension differs from the query.
   */
  RetrievalResult retrieve(const Embedding &query_embedding, int k) const;

  const RetrieverOptions &options() const {
    return options_;
  }

 private:
  RetrievalResult retrieve_exact(const Embedding &query_embedding, size_t k) const;
  RetrievalResult retrieve_indexed(const Embedding &query_embedding, size_t k) const;

  std::shared_ptr<const DocumentStore> store_;
  RetrieverOptions options_;
  std::unique_ptr<FaissIndex> index_;
};

// Strict weak ordering used for every retrieval result.
bool ranks_before(const ScoredChunk &a, const ScoredChunk &b);

}  // namespace lore_core
