#pragma once

#include <string>
#include <vector>

namespace lore_core {

using Embedding = std::vector<float>;

struct ChunkMetadata {
  std::string source;
  int chunk_index = 0;
};

// A retrievable unit of text. Never modified once it has been stored.
struct Chunk {
  std::string id;
  std::string content;
  ChunkMetadata metadata;
};

// Chunk ids are "<source>#<chunk_index>", so the same document always yields the same ids.
std::string make_chunk_id(const std::string& source, int chunk_index);

Chunk make_chunk(const std::string& source, int chunk_index, std::string content);

}  // namespace lore_core
