#include "lore_core/db/snapshot_repository.hpp"

#include <cstring>
#include <iostream>

#include "lore_core/db/sqlite_error_utils.hpp"
#include "lore_core/db/transaction.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/services/compression_service.hpp"
#include "lore_core/store/document_store.hpp"

namespace lore_core {

namespace {

std::vector<char> to_blob(const Embedding &embedding) {
  std::vector<char> blob(embedding.size() * sizeof(float));
  std::memcpy(blob.data(), embedding.data(), blob.size());
  return blob;
}

Embedding from_blob(const std::vector<char> &blob, const std::string &chunk_id) {
  if (blob.empty() || blob.size() % sizeof(float) != 0) {
    throw StoreError("Snapshot row '" + chunk_id + "' has a malformed vector blob of " +
                     std::to_string(blob.size()) + " bytes");
  }
  Embedding embedding(blob.size() / sizeof(float));
  std::memcpy(embedding.data(), blob.data(), blob.size());
  return embedding;
}

}  // namespace

SnapshotRepository::SnapshotRepository(const std::filesystem::path &db_path) : db_path_(db_path) {
  try {
    if (db_path_.has_parent_path()) {
      std::filesystem::create_directories(db_path_.parent_path());
    }
    db_ = std::make_unique<sqlite::database>(db_path_.string());
    setup_schema();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("open snapshot " + db_path_.string(), e));
  } catch (const std::filesystem::filesystem_error &e) {
    throw StoreError("Cannot create snapshot directory: " + std::string(e.what()));
  }
}

void SnapshotRepository::setup_schema() {
  int version = 0;
  *db_ << "PRAGMA user_version;" >> version;
  if (version > SCHEMA_VERSION) {
    throw StoreError("Snapshot " + db_path_.string() + " has schema version " +
                     std::to_string(version) + ", newer than supported version " +
                     std::to_string(SCHEMA_VERSION));
  }

  *db_ << "PRAGMA journal_mode = WAL;";
  *db_ << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          position INTEGER PRIMARY KEY,
          id TEXT UNIQUE NOT NULL,
          source TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL,
          vector_blob BLOB NOT NULL
      )
    )";
  *db_ << "CREATE INDEX IF NOT EXISTS idx_chunks_source ON chunks(source, chunk_index)";
  *db_ << "PRAGMA user_version = " + std::to_string(SCHEMA_VERSION) + ";";
}

size_t SnapshotRepository::save(const DocumentStore &store) {
  // Copy out under the store's read lock, write without holding it
  std::vector<StoreEntry> entries = store.all_entries();

  try {
    Transaction tx(*db_, /*immediate*/ true);
    *db_ << "DELETE FROM chunks;";

    // An unused prepared statement runs on destruction, so only prepare one with rows to bind
    if (!entries.empty()) {
      auto insert = *db_ << "INSERT INTO chunks (position, id, source, chunk_index, content, "
                            "vector_blob) VALUES (?, ?, ?, ?, ?, ?)";
      for (size_t position = 0; position < entries.size(); ++position) {
        const StoreEntry &entry = entries[position];
        insert << static_cast<int64_t>(position) << entry.chunk.id << entry.chunk.metadata.source
               << entry.chunk.metadata.chunk_index
               << CompressionService::compress(entry.chunk.content) << to_blob(entry.embedding);
        insert++;
      }
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("save snapshot", e));
  }

  std::cout << "[Snapshot] Saved " << entries.size() << " chunk(s) to " << db_path_.string()
            << std::endl;
  return entries.size();
}

size_t SnapshotRepository::load_into(DocumentStore &store) {
  if (store.size() != 0) {
    throw StoreError("Refusing to load a snapshot into a non-empty document store");
  }

  size_t loaded = 0;
  try {
    *db_ << "SELECT id, source, chunk_index, content, vector_blob FROM chunks ORDER BY position" >>
        [&](std::string id, std::string source, int chunk_index, std::vector<char> content,
            std::vector<char> vector_blob) {
          Chunk chunk;
          chunk.id = std::move(id);
          chunk.metadata.source = std::move(source);
          chunk.metadata.chunk_index = chunk_index;
          chunk.content = CompressionService::decompress(content);
          Embedding embedding = from_blob(vector_blob, chunk.id);
          store.insert(std::move(chunk), std::move(embedding));
          ++loaded;
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("load snapshot", e));
  }

  std::cout << "[Snapshot] Loaded " << loaded << " chunk(s) from " << db_path_.string()
            << std::endl;
  return loaded;
}

size_t SnapshotRepository::saved_count() {
  int64_t count = 0;
  try {
    *db_ << "SELECT COUNT(*) FROM chunks;" >> count;
  } catch (const sqlite::sqlite_exception &e) {
    throw StoreError(format_db_error("count snapshot rows", e));
  }
  return static_cast<size_t>(count);
}

}  // namespace lore_core
