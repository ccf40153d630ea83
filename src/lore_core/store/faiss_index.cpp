#include "lore_core/store/faiss_index.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/IndexHNSW.h>

#include <algorithm>

#include "lore_core/errors.hpp"
#include "lore_core/store/similarity.hpp"

namespace lore_core {

std::string to_string(IndexKind kind) {
  switch (kind) {
    case IndexKind::Exact:
      return "exact";
    case IndexKind::FaissFlat:
      return "faiss_flat";
    case IndexKind::FaissHnsw:
      return "faiss_hnsw";
    default:
      return "unknown";
  }
}

IndexKind index_kind_from_string(const std::string &str) {
  if (str == "exact")
    return IndexKind::Exact;
  if (str == "faiss_flat")
    return IndexKind::FaissFlat;
  if (str == "faiss_hnsw")
    return IndexKind::FaissHnsw;
  throw InvalidConfiguration("Unknown retrieval index '" + str +
                             "'. Expected exact, faiss_flat or faiss_hnsw");
}

FaissIndex::FaissIndex(const DocumentStore &store, IndexKind kind) : store_(store), kind_(kind) {
  if (kind_ == IndexKind::Exact) {
    throw InvalidConfiguration("FaissIndex requires a faiss index kind");
  }
}

FaissIndex::~FaissIndex() = default;

std::unique_ptr<faiss::Index> FaissIndex::create_base_index(size_t dimension) const {
  const auto d = static_cast<faiss::idx_t>(dimension);
  if (kind_ == IndexKind::FaissHnsw) {
    auto index = std::make_unique<faiss::IndexHNSWFlat>(d, HNSW_M_PARAM,
                                                        faiss::METRIC_INNER_PRODUCT);
    index->hnsw.efConstruction = HNSW_EF_CONSTRUCTION_PARAM;
    index->hnsw.efSearch = HNSW_EF_SEARCH_PARAM;
    return index;
  }
  return std::make_unique<faiss::IndexFlatIP>(d);
}

void FaissIndex::sync() {
  std::vector<StoreEntry> fresh = store_.entries_from(indexed_count_);
  if (fresh.empty()) {
    return;
  }
  if (!index_) {
    index_ = create_base_index(fresh.front().embedding.size());
  }

  const size_t dimension = static_cast<size_t>(index_->d);
  std::vector<float> flat;
  flat.reserve(fresh.size() * dimension);
  for (const auto &entry : fresh) {
    std::vector<float> normalized = l2_normalized(entry.embedding);
    flat.insert(flat.end(), normalized.begin(), normalized.end());
  }
  index_->add(static_cast<faiss::idx_t>(fresh.size()), flat.data());
  indexed_count_ += fresh.size();
}

std::vector<size_t> FaissIndex::nearest(const Embedding &query, size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  sync();
  if (!index_ || index_->ntotal == 0 || count == 0) {
    return {};
  }
  if (query.size() != static_cast<size_t>(index_->d)) {
    throw DimensionMismatch(static_cast<size_t>(index_->d), query.size());
  }

  const auto k = static_cast<faiss::idx_t>(std::min<size_t>(count, index_->ntotal));
  std::vector<float> normalized = l2_normalized(query);
  std::vector<float> distances(k);
  std::vector<faiss::idx_t> labels(k);
  index_->search(1, normalized.data(), k, distances.data(), labels.data());

  std::vector<size_t> positions;
  positions.reserve(k);
  for (faiss::idx_t label : labels) {
    if (label >= 0) {
      positions.push_back(static_cast<size_t>(label));
    }
  }
  return positions;
}

size_t FaissIndex::indexed_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return indexed_count_;
}

}  // namespace lore_core
