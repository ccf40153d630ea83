#include "lore_core/services/retriever.hpp"

#include <algorithm>

#include "lore_core/errors.hpp"
#include "lore_core/store/similarity.hpp"

namespace lore_core {

namespace {

struct Candidate {
  size_t position;
  double score;
};

}  // namespace

bool ranks_before(const ScoredChunk &a, const ScoredChunk &b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.chunk.metadata.chunk_index != b.chunk.metadata.chunk_index) {
    return a.chunk.metadata.chunk_index < b.chunk.metadata.chunk_index;
  }
  return a.chunk.metadata.source < b.chunk.metadata.source;
}

Retriever::Retriever(std::shared_ptr<const DocumentStore> store, RetrieverOptions options)
    : store_(std::move(store)), options_(options) {
  if (!store_) {
    throw InvalidConfiguration("Retriever requires a document store");
  }
  if (options_.candidate_multiplier == 0) {
    throw InvalidConfiguration("candidate_multiplier must be at least 1");
  }
  if (options_.index != IndexKind::Exact) {
    index_ = std::make_unique<FaissIndex>(*store_, options_.index);
  }
}

RetrievalResult Retriever::retrieve(const Embedding &query_embedding, int k) const {
  if (k < 1) {
    throw InvalidConfiguration("k must be at least 1, got " + std::to_string(k));
  }
  if (index_) {
    return retrieve_indexed(query_embedding, static_cast<size_t>(k));
  }
  return retrieve_exact(query_embedding, static_cast<size_t>(k));
}

RetrievalResult Retriever::retrieve_exact(const Embedding &query_embedding, size_t k) const {
  RetrievalResult result;

  store_->read([&](const std::vector<Chunk> &chunks, const std::vector<Embedding> &embeddings) {
    if (chunks.empty()) {
      return;
    }
    if (embeddings.front().size() != query_embedding.size()) {
      throw DimensionMismatch(embeddings.front().size(), query_embedding.size());
    }

    std::vector<Candidate> candidates;
    candidates.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
      candidates.push_back({i, cosine_similarity(query_embedding, embeddings[i])});
    }

    auto before = [&](const Candidate &a, const Candidate &b) {
      if (a.score != b.score) {
        return a.score > b.score;
      }
      const auto &ma = chunks[a.position].metadata;
      const auto &mb = chunks[b.position].metadata;
      if (ma.chunk_index != mb.chunk_index) {
        return ma.chunk_index < mb.chunk_index;
      }
      return ma.source < mb.source;
    };

    const size_t take = std::min(k, candidates.size());
    std::partial_sort(candidates.begin(), candidates.begin() + take, candidates.end(), before);

    result.reserve(take);
    for (size_t i = 0; i < take; ++i) {
      result.push_back({chunks[candidates[i].position], candidates[i].score});
    }
  });

  return result;
}

RetrievalResult Retriever::retrieve_indexed(const Embedding &query_embedding, size_t k) const {
  const size_t dimension = store_->dimension();
  if (dimension == 0) {
    return {};
  }
  if (dimension != query_embedding.size()) {
    throw DimensionMismatch(dimension, query_embedding.size());
  }

  auto rescore = [&](const std::vector<size_t> &positions) {
    RetrievalResult scored;
    scored.reserve(positions.size());
    for (size_t position : positions) {
      std::optional<StoreEntry> entry = store_->at(position);
      if (!entry) {
        continue;
      }
      const double score = cosine_similarity(query_embedding, entry->embedding);
      scored.push_back({std::move(entry->chunk), score});
    }
    std::sort(scored.begin(), scored.end(), ranks_before);
    return scored;
  };

  const size_t total = store_->size();
  size_t pool = std::min(total, k * options_.candidate_multiplier);
  RetrievalResult result = rescore(index_->nearest(query_embedding, pool));

  // Entries outside the pool can tie with the k-th result. Widen until the pool's worst
  // candidate scores strictly below it so the chunk-index tie-break sees every tied entry.
  while (pool < total && result.size() > k && result.back().score == result[k - 1].score) {
    pool = std::min(total, pool * 2);
    result = rescore(index_->nearest(query_embedding, pool));
  }

  if (result.size() > k) {
    result.resize(k);
  }
  return result;
}

}  // namespace lore_core
