#pragma once

#include <sqlite_modern_cpp.h>

#include <filesystem>
#include <memory>
#include <string>

namespace lore_core {

class DocumentStore;

/**
 * @class SnapshotRepository
 * @brief Persists the whole document store to a single SQLite file and restores it.
 *
 * Chunk text is stored zstd-compressed, embeddings as raw little-endian float blobs. Rows keep
 * their store position so a restored store ranks ties exactly like the original.
 */
class SnapshotRepository {
 public:
  static constexpr int SCHEMA_VERSION = 1;

  // Opens or creates the snapshot file. @throw StoreError
  explicit SnapshotRepository(const std::filesystem::path &db_path);

  SnapshotRepository(const SnapshotRepository &) = delete;
  SnapshotRepository &operator=(const SnapshotRepository &) = delete;

  /**
   * @brief Replaces the snapshot contents with every entry currently in the store.
   * @return The number of chunks written.
   * @throw StoreError on any SQLite or compression failure; the previous snapshot is kept.
   */
  size_t save(const DocumentStore &store);

  /**
   * @brief Inserts every saved chunk into the store, in saved order.
   * @return The number of chunks loaded.
   * @throw StoreError if the store is not empty or the snapshot is unreadable.
   */
  size_t load_into(DocumentStore &store);

  size_t saved_count();

  const std::filesystem::path &path() const {
    return db_path_;
  }

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::unique_ptr<sqlite::database> db_;
};

}  // namespace lore_core
