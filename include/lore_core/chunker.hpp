#pragma once

#include <string>
#include <vector>

#include "lore_core/types/chunk.hpp"

namespace lore_core {

/**
 * @class Chunker
 * @brief Splits text into fixed-size, overlapping segments.
 *
 * Sizes and offsets are counted in Unicode code points, so a segment boundary never
 * falls inside a multi-byte UTF-8 sequence. Every segment except possibly the last holds
 * exactly chunk_size code points, and consecutive segments share exactly overlap code
 * points.
 */
class Chunker {
 public:
  /**
   * @throw InvalidConfiguration if chunk_size <= 0, overlap < 0 or overlap >= chunk_size.
   */
  Chunker(int chunk_size, int overlap);

  std::vector<std::string> split(const std::string& text) const;

  // Same segmentation, with ids and chunk indices assigned in document order.
  std::vector<Chunk> to_chunks(const std::string& source, const std::string& text) const;

  int chunk_size() const {
    return chunk_size_;
  }
  int overlap() const {
    return overlap_;
  }

  static std::vector<std::string> chunk(const std::string& text, int chunk_size, int overlap);

 private:
  static void validate(int chunk_size, int overlap);

  int chunk_size_;
  int overlap_;
};

}  // namespace lore_core
