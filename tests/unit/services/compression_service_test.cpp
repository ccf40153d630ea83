#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "lore_core/errors.hpp"
#include "lore_core/services/compression_service.hpp"

namespace lore_core {

TEST(CompressionServiceTest, RestoresOriginalText) {
  std::string text;
  while (text.size() < 5000) {
    text += "Chunks of prose compress well because words repeat. ";
  }

  std::vector<char> compressed = CompressionService::compress(text);
  EXPECT_LT(compressed.size(), text.size());
  EXPECT_EQ(CompressionService::decompress(compressed), text);
}

TEST(CompressionServiceTest, KeepsMultiByteText) {
  const std::string text = "Caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x93\x9A";
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(text, 19)), text);
}

TEST(CompressionServiceTest, EmptyInputStaysEmpty) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_EQ(CompressionService::decompress({}), "");
}

TEST(CompressionServiceTest, RejectsDataThatIsNotZstd) {
  std::vector<char> garbage = {'n', 'o', 't', ' ', 'z', 's', 't', 'd'};
  EXPECT_THROW(CompressionService::decompress(garbage), StoreError);
}

}  // namespace lore_core
