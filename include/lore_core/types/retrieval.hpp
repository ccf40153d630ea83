#pragma once

#include <vector>

#include "lore_core/types/chunk.hpp"

namespace lore_core {

struct ScoredChunk {
  Chunk chunk;
  double score = 0.0;
};

// Ordered by descending score, never longer than the requested k.
using RetrievalResult = std::vector<ScoredChunk>;

}  // namespace lore_core
