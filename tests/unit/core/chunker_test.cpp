#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lore_core/chunker.hpp"
#include "lore_core/errors.hpp"

namespace lore_core {

TEST(ChunkerTest, SplitsWithOverlap) {
  std::vector<std::string> chunks = Chunker::chunk("ABCDEFGHIJKLMNO", 10, 3);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "ABCDEFGHIJ");
  EXPECT_EQ(chunks[1], "HIJKLMNO");
}

TEST(ChunkerTest, ShortTextIsSingleChunk) {
  std::vector<std::string> chunks = Chunker::chunk("hello", 10, 3);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "hello");
}

TEST(ChunkerTest, EmptyTextProducesNoChunks) {
  EXPECT_TRUE(Chunker::chunk("", 10, 3).empty());
}

TEST(ChunkerTest, ExactMultipleDoesNotEmitOverlapOnlyTail) {
  // 10 characters, size 5, overlap 0: exactly two chunks
  std::vector<std::string> chunks = Chunker::chunk("0123456789", 5, 0);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "01234");
  EXPECT_EQ(chunks[1], "56789");

  // With overlap the last chunk ends at the text end, never past it
  chunks = Chunker::chunk("0123456789", 6, 2);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "012345");
  EXPECT_EQ(chunks[1], "456789");
}

TEST(ChunkerTest, ConsecutiveChunksShareExactlyOverlap) {
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += static_cast<char>('a' + (i % 26));
  }
  const int size = 17;
  const int overlap = 5;
  std::vector<std::string> chunks = Chunker::chunk(text, size, overlap);

  ASSERT_GT(chunks.size(), 2u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_LE(chunks[i].size(), static_cast<size_t>(size));
    if (i + 1 < chunks.size()) {
      EXPECT_EQ(chunks[i].size(), static_cast<size_t>(size));
      EXPECT_EQ(chunks[i].substr(size - overlap), chunks[i + 1].substr(0, overlap));
    }
  }

  // Reassembling without the overlaps gives back the text
  std::string rebuilt = chunks[0];
  for (size_t i = 1; i < chunks.size(); ++i) {
    rebuilt += chunks[i].substr(overlap);
  }
  EXPECT_EQ(rebuilt, text);
}

TEST(ChunkerTest, CountsCodePointsNotBytes) {
  // Each of these is a two-byte UTF-8 sequence
  const std::string text = "\xC3\xA9\xC3\xA8\xC3\xAA\xC3\xAB\xC3\xA0";  // éèêëà
  std::vector<std::string> chunks = Chunker::chunk(text, 2, 0);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "\xC3\xA9\xC3\xA8");
  EXPECT_EQ(chunks[1], "\xC3\xAA\xC3\xAB");
  EXPECT_EQ(chunks[2], "\xC3\xA0");
}

TEST(ChunkerTest, InvalidUtf8IsReplacedNotSplit) {
  const std::string text = std::string("ab") + '\xFF' + "cd";
  std::vector<std::string> chunks = Chunker::chunk(text, 10, 0);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "ab\xEF\xBF\xBD" "cd");
}

TEST(ChunkerTest, RejectsInvalidParameters) {
  EXPECT_THROW(Chunker(0, 0), InvalidConfiguration);
  EXPECT_THROW(Chunker(-5, 0), InvalidConfiguration);
  EXPECT_THROW(Chunker(10, -1), InvalidConfiguration);
  EXPECT_THROW(Chunker(10, 10), InvalidConfiguration);
  EXPECT_THROW(Chunker(10, 12), InvalidConfiguration);
  EXPECT_NO_THROW(Chunker(10, 9));
}

TEST(ChunkerTest, ToChunksAssignsIdsAndIndices) {
  Chunker chunker(10, 3);
  std::vector<Chunk> chunks = chunker.to_chunks("notes.txt", "ABCDEFGHIJKLMNO");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].id, "notes.txt#0");
  EXPECT_EQ(chunks[0].metadata.source, "notes.txt");
  EXPECT_EQ(chunks[0].metadata.chunk_index, 0);
  EXPECT_EQ(chunks[1].id, "notes.txt#1");
  EXPECT_EQ(chunks[1].metadata.chunk_index, 1);
  EXPECT_EQ(chunks[1].content, "HIJKLMNO");
}

TEST(ChunkerTest, IsDeterministic) {
  Chunker chunker(7, 2);
  const std::string text = "The quick brown fox jumps over the lazy dog";
  EXPECT_EQ(chunker.split(text), chunker.split(text));
}

}  // namespace lore_core
