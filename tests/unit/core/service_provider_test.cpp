#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/service_provider.hpp"

namespace lore_core {

class ServiceProviderTest : public lore_tests::ServiceProviderTestBase {};

TEST_F(ServiceProviderTest, ExposesInjectedServices) {
  EXPECT_EQ(&services_->get_document_store(), store_.get());
  EXPECT_EQ(&services_->get_embedding_provider(), embedder_.get());
  EXPECT_EQ(&services_->get_generation_provider(), generator_.get());
  EXPECT_EQ(&services_->get_extractor_factory(), extractor_factory_.get());
  EXPECT_EQ(services_->document_store_ptr(), store_);
}

TEST_F(ServiceProviderTest, RejectsMissingServices) {
  EXPECT_THROW(ServiceProvider(nullptr, embedder_, generator_, extractor_factory_),
               InvalidConfiguration);
  EXPECT_THROW(ServiceProvider(store_, nullptr, generator_, extractor_factory_),
               InvalidConfiguration);
  EXPECT_THROW(ServiceProvider(store_, embedder_, nullptr, extractor_factory_),
               InvalidConfiguration);
  EXPECT_THROW(ServiceProvider(store_, embedder_, generator_, nullptr), InvalidConfiguration);
}

}  // namespace lore_core
