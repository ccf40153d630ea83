#pragma once

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lore_core/types/chunk.hpp"

namespace lore_core {

struct StoreEntry {
  Chunk chunk;
  Embedding embedding;
};

struct SourceSummary {
  std::string source;
  size_t chunk_count = 0;
};

/**
 * @class DocumentStore
 * @brief Append-only owner of every stored chunk and its embedding.
 *
 * Chunks and embeddings live in parallel arenas addressed by insertion position, with an
 * id -> position map for lookups. The embedding dimensionality is fixed by the first
 * insertion. Readers take a shared lock and always observe a consistent prefix of the
 * arenas; writers take an exclusive lock for the append only.
 */
class DocumentStore {
 public:
  DocumentStore() = default;

  DocumentStore(const DocumentStore &) = delete;
  DocumentStore &operator=(const DocumentStore &) = delete;
  DocumentStore(DocumentStore &&) = delete;
  DocumentStore &operator=(DocumentStore &&) = delete;

  /**
   * @brief Appends a chunk and its embedding.
   *
   * @throw DimensionMismatch if the embedding length differs from the store's dimension.
   * @throw StoreError if the id is already present, or the content or embedding is empty.
   */
  void insert(Chunk chunk, Embedding embedding);

  std::vector<StoreEntry> all_entries() const;

  // Entries at positions [offset, size()), in insertion order.
  std::vector<StoreEntry> entries_from(size_t offset) const;

  // Hands the reader both arenas under a single shared lock. The references are only valid
  // for the duration of the call.
  void read(const std::function<void(const std::vector<Chunk> &, const std::vector<Embedding> &)>
                &reader) const;

  std::optional<StoreEntry> find(const std::string &chunk_id) const;
  std::optional<StoreEntry> at(size_t position) const;

  size_t size() const;

  // 0 until the first insertion
  size_t dimension() const;

  std::vector<SourceSummary> sources() const;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<Chunk> chunks_;
  std::vector<Embedding> embeddings_;
  std::unordered_map<std::string, size_t> position_by_id_;
  size_t dimension_ = 0;
};

}  // namespace lore_core
