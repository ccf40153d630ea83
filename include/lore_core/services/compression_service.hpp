#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lore_core {

class CompressionService {
 public:
  /**
   * @brief Compresses a block of data using Zstandard.
   * @param data The data to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame; empty input gives an empty vector.
   * @throw StoreError if zstd reports an error.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a single Zstandard frame produced by compress().
   * @throw StoreError if the data is not a zstd frame with a known content size.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace lore_core
