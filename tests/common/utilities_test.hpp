#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "lore_core/service_provider.hpp"
#include "lore_core/store/document_store.hpp"

namespace lore_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Unique path under the temp directory; nothing is created
  static std::filesystem::path create_temp_path(const std::string& prefix,
                                                const std::string& extension = "");
  static std::filesystem::path write_temp_file(const std::string& name, const std::string& content);
  static void cleanup_temp_path(const std::filesystem::path& path);

  // Deterministic unit-length vector derived from the seed text
  static lore_core::Embedding create_test_vector(const std::string& seed_text, int dimension = 8);

  static lore_core::Chunk create_test_chunk(const std::string& source, int chunk_index,
                                            const std::string& content = "");

  // Inserts count chunks of one source, chunk i embedded as create_test_vector(source#i)
  static void populate_store(lore_core::DocumentStore& store, const std::string& source, int count,
                             int dimension = 8);
};

/**
 * Base fixture wiring a fresh DocumentStore and mock providers into a ServiceProvider.
 */
class ServiceProviderTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<lore_core::DocumentStore>();
    embedder_ = std::make_shared<testing::NiceMock<MockEmbeddingProvider>>();
    generator_ = std::make_shared<testing::NiceMock<MockGenerationProvider>>();
    extractor_factory_ = std::make_shared<testing::NiceMock<MockContentExtractorFactory>>();
    services_ = std::make_shared<lore_core::ServiceProvider>(store_, embedder_, generator_,
                                                             extractor_factory_);
  }

  std::shared_ptr<lore_core::DocumentStore> store_;
  std::shared_ptr<testing::NiceMock<MockEmbeddingProvider>> embedder_;
  std::shared_ptr<testing::NiceMock<MockGenerationProvider>> generator_;
  std::shared_ptr<testing::NiceMock<MockContentExtractorFactory>> extractor_factory_;
  std::shared_ptr<lore_core::ServiceProvider> services_;
};

}  // namespace lore_tests
