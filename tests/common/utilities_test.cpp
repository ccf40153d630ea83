#include "common/utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <fstream>
#include <functional>

namespace lore_tests {

std::filesystem::path TestUtilities::create_temp_path(const std::string& prefix,
                                                      const std::string& extension) {
  static std::atomic<int> counter{0};
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++) + extension);
}

std::filesystem::path TestUtilities::write_temp_file(const std::string& name,
                                                     const std::string& content) {
  std::filesystem::path dir = create_temp_path("lore_test_files");
  std::filesystem::create_directories(dir);
  std::filesystem::path file_path = dir / name;
  std::ofstream file(file_path, std::ios::binary);
  file << content;
  return file_path;
}

void TestUtilities::cleanup_temp_path(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
}

lore_core::Embedding TestUtilities::create_test_vector(const std::string& seed_text,
                                                       int dimension) {
  std::hash<std::string> hasher;
  size_t seed = hasher(seed_text);
  lore_core::Embedding vec(dimension);
  double norm = 0.0;
  for (int i = 0; i < dimension; ++i) {
    seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
    vec[i] = static_cast<float>((seed >> 33) % 1000) / 1000.0f + 0.001f;
    norm += static_cast<double>(vec[i]) * vec[i];
  }
  const double length = std::sqrt(norm);
  for (float& value : vec) {
    value = static_cast<float>(value / length);
  }
  return vec;
}

lore_core::Chunk TestUtilities::create_test_chunk(const std::string& source, int chunk_index,
                                                  const std::string& content) {
  std::string text =
      content.empty() ? "content of " + source + " chunk " + std::to_string(chunk_index) : content;
  return lore_core::make_chunk(source, chunk_index, text);
}

void TestUtilities::populate_store(lore_core::DocumentStore& store, const std::string& source,
                                   int count, int dimension) {
  for (int i = 0; i < count; ++i) {
    store.insert(create_test_chunk(source, i),
                 create_test_vector(lore_core::make_chunk_id(source, i), dimension));
  }
}

}  // namespace lore_tests
