#include <gtest/gtest.h>

#include <fstream>

#include "common/utilities_test.hpp"
#include "lore_core/db/snapshot_repository.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/services/retriever.hpp"
#include "lore_core/store/document_store.hpp"

namespace lore_core {

using lore_tests::TestUtilities;

class SnapshotRepositoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_dir_ = TestUtilities::create_temp_path("lore_snapshot_test");
    db_path_ = temp_dir_ / "nested" / "lore.db";
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_path(temp_dir_);
  }

  std::filesystem::path temp_dir_;
  std::filesystem::path db_path_;
};

TEST_F(SnapshotRepositoryTest, CreatesFileAndParentDirectories) {
  SnapshotRepository repository(db_path_);
  EXPECT_TRUE(std::filesystem::exists(db_path_));
  EXPECT_EQ(repository.saved_count(), 0u);
}

TEST_F(SnapshotRepositoryTest, RestoresChunksEmbeddingsAndOrder) {
  DocumentStore original;
  TestUtilities::populate_store(original, "first.md", 3, 16);
  original.insert(make_chunk("unicode.txt", 0, "Caf\xC3\xA9 na\xC3\xAFve \xE2\x82\xAC"),
                  TestUtilities::create_test_vector("unicode", 16));

  {
    SnapshotRepository repository(db_path_);
    EXPECT_EQ(repository.save(original), 4u);
  }

  DocumentStore restored;
  SnapshotRepository repository(db_path_);
  EXPECT_EQ(repository.load_into(restored), 4u);

  std::vector<StoreEntry> expected = original.all_entries();
  std::vector<StoreEntry> actual = restored.all_entries();
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(actual[i].chunk.id, expected[i].chunk.id);
    EXPECT_EQ(actual[i].chunk.content, expected[i].chunk.content);
    EXPECT_EQ(actual[i].chunk.metadata.source, expected[i].chunk.metadata.source);
    EXPECT_EQ(actual[i].chunk.metadata.chunk_index, expected[i].chunk.metadata.chunk_index);
    EXPECT_EQ(actual[i].embedding, expected[i].embedding);
  }
  EXPECT_EQ(restored.dimension(), 16u);
}

TEST_F(SnapshotRepositoryTest, RestoredStoreRetrievesIdentically) {
  auto original = std::make_shared<DocumentStore>();
  TestUtilities::populate_store(*original, "doc", 20);
  SnapshotRepository repository(db_path_);
  repository.save(*original);

  auto restored = std::make_shared<DocumentStore>();
  repository.load_into(*restored);

  Embedding query = TestUtilities::create_test_vector("question");
  RetrievalResult before = Retriever(original).retrieve(query, 5);
  RetrievalResult after = Retriever(restored).retrieve(query, 5);
  ASSERT_EQ(before.size(), after.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_EQ(before[i].chunk.id, after[i].chunk.id);
    EXPECT_DOUBLE_EQ(before[i].score, after[i].score);
  }
}

TEST_F(SnapshotRepositoryTest, SaveReplacesPreviousSnapshot) {
  SnapshotRepository repository(db_path_);
  DocumentStore store;
  TestUtilities::populate_store(store, "a", 5);
  repository.save(store);

  DocumentStore smaller;
  TestUtilities::populate_store(smaller, "b", 2);
  repository.save(smaller);
  EXPECT_EQ(repository.saved_count(), 2u);

  DocumentStore empty;
  repository.save(empty);
  EXPECT_EQ(repository.saved_count(), 0u);
}

TEST_F(SnapshotRepositoryTest, RefusesToLoadIntoNonEmptyStore) {
  SnapshotRepository repository(db_path_);
  DocumentStore store;
  TestUtilities::populate_store(store, "a", 1);
  EXPECT_THROW(repository.load_into(store), StoreError);
}

TEST_F(SnapshotRepositoryTest, NonDatabaseFileIsRejected) {
  std::filesystem::create_directories(db_path_.parent_path());
  {
    std::ofstream bogus(db_path_, std::ios::binary);
    bogus << std::string(4096, 'x');
  }
  EXPECT_THROW(SnapshotRepository repository(db_path_), StoreError);
}

}  // namespace lore_core
