#include "lore_core/extractors/content_extractor.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <fstream>
#include <iomanip>
#include <sstream>

#include "lore_core/errors.hpp"

namespace lore_core {

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ExtractionFailed("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw ExtractionFailed("Could not read file: " + file_path.string());
  }
  return buffer.str();
}

std::string ContentExtractor::compute_hash_from_content(const std::string& content) const {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!mdctx) {
    throw ExtractionFailed("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw ExtractionFailed("Failed to initialize SHA256 digest");
  }
  if (EVP_DigestUpdate(mdctx.get(), content.data(), content.length()) != 1) {
    throw ExtractionFailed("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
    throw ExtractionFailed("Failed to finalize SHA256 digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string ContentExtractor::get_content_hash(const fs::path& file_path) const {
  return compute_hash_from_content(get_string_content(file_path));
}

void ContentExtractor::ensure_valid_utf8(const std::string& content,
                                         const fs::path& file_path) const {
  auto invalid = utf8::find_invalid(content.begin(), content.end());
  if (invalid != content.end()) {
    throw ExtractionFailed("File is not valid UTF-8 text: " + file_path.string() +
                           " (first invalid byte at offset " +
                           std::to_string(invalid - content.begin()) + ")");
  }
}

}  // namespace lore_core
