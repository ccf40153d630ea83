#pragma once

#include <faiss/Index.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lore_core/store/document_store.hpp"

namespace lore_core {

enum class IndexKind { Exact, FaissFlat, FaissHnsw };

std::string to_string(IndexKind kind);

// @throw InvalidConfiguration for names other than "exact", "faiss_flat" and "faiss_hnsw"
IndexKind index_kind_from_string(const std::string &str);

/**
 * @class FaissIndex
 * @brief Faiss inner-product index over the L2-normalized embeddings of a DocumentStore.
 *
 * Faiss labels are store positions. Because the store is append-only the index only ever
 * adds the entries it has not seen yet, lazily on the next search.
 */
class FaissIndex {
 public:
  FaissIndex(const DocumentStore &store, IndexKind kind);
  ~FaissIndex();

  FaissIndex(const FaissIndex &) = delete;
  FaissIndex &operator=(const FaissIndex &) = delete;

  // Store positions of up to `count` nearest entries, best first.
  std::vector<size_t> nearest(const Embedding &query, size_t count);

  size_t indexed_count() const;

 private:
  void sync();
  std::unique_ptr<faiss::Index> create_base_index(size_t dimension) const;

  const DocumentStore &store_;
  IndexKind kind_;
  mutable std::mutex mutex_;
  std::unique_ptr<faiss::Index> index_;
  size_t indexed_count_ = 0;

  const int HNSW_M_PARAM = 32;
  const int HNSW_EF_CONSTRUCTION_PARAM = 100;
  const int HNSW_EF_SEARCH_PARAM = 64;
};

}  // namespace lore_core
