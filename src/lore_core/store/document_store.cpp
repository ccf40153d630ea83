#include "lore_core/store/document_store.hpp"

#include <mutex>

#include "lore_core/errors.hpp"

namespace lore_core {

void DocumentStore::insert(Chunk chunk, Embedding embedding) {
  if (chunk.content.empty()) {
    throw StoreError("Refusing to store chunk '" + chunk.id + "' with empty content");
  }
  if (embedding.empty()) {
    throw StoreError("Refusing to store chunk '" + chunk.id + "' with an empty embedding");
  }

  std::unique_lock lock(mutex_);
  if (dimension_ != 0 && embedding.size() != dimension_) {
    throw DimensionMismatch(dimension_, embedding.size());
  }
  if (position_by_id_.count(chunk.id) != 0) {
    throw StoreError("Chunk '" + chunk.id + "' is already stored");
  }

  const size_t position = chunks_.size();
  position_by_id_.emplace(chunk.id, position);
  if (dimension_ == 0) {
    dimension_ = embedding.size();
  }
  chunks_.push_back(std::move(chunk));
  embeddings_.push_back(std::move(embedding));
}

std::vector<StoreEntry> DocumentStore::all_entries() const {
  return entries_from(0);
}

std::vector<StoreEntry> DocumentStore::entries_from(size_t offset) const {
  std::shared_lock lock(mutex_);
  std::vector<StoreEntry> entries;
  if (offset >= chunks_.size()) {
    return entries;
  }
  entries.reserve(chunks_.size() - offset);
  for (size_t i = offset; i < chunks_.size(); ++i) {
    entries.push_back({chunks_[i], embeddings_[i]});
  }
  return entries;
}

void DocumentStore::read(
    const std::function<void(const std::vector<Chunk> &, const std::vector<Embedding> &)> &reader)
    const {
  std::shared_lock lock(mutex_);
  reader(chunks_, embeddings_);
}

std::optional<StoreEntry> DocumentStore::find(const std::string &chunk_id) const {
  std::shared_lock lock(mutex_);
  auto it = position_by_id_.find(chunk_id);
  if (it == position_by_id_.end()) {
    return std::nullopt;
  }
  return StoreEntry{chunks_[it->second], embeddings_[it->second]};
}

std::optional<StoreEntry> DocumentStore::at(size_t position) const {
  std::shared_lock lock(mutex_);
  if (position >= chunks_.size()) {
    return std::nullopt;
  }
  return StoreEntry{chunks_[position], embeddings_[position]};
}

size_t DocumentStore::size() const {
  std::shared_lock lock(mutex_);
  return chunks_.size();
}

size_t DocumentStore::dimension() const {
  std::shared_lock lock(mutex_);
  return dimension_;
}

std::vector<SourceSummary> DocumentStore::sources() const {
  std::shared_lock lock(mutex_);
  std::vector<SourceSummary> summaries;
  std::unordered_map<std::string, size_t> summary_by_source;
  for (const auto &chunk : chunks_) {
    auto [it, inserted] = summary_by_source.emplace(chunk.metadata.source, summaries.size());
    if (inserted) {
      summaries.push_back({chunk.metadata.source, 0});
    }
    summaries[it->second].chunk_count++;
  }
  return summaries;
}

}  // namespace lore_core
