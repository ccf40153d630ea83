#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/services/rag_service.hpp"

namespace lore_core {

using testing::_;
using testing::HasSubstr;
using testing::Return;

class RagServiceTest : public lore_tests::ServiceProviderTestBase {
 protected:
  void SetUp() override {
    ServiceProviderTestBase::SetUp();
    store_->insert(make_chunk("france.md", 0, "Paris is the capital of France."), {1.0f, 0.0f});
    store_->insert(make_chunk("cooking.md", 0, "Boil pasta for ten minutes."), {0.0f, 1.0f});
    store_->insert(make_chunk("rivers.md", 0, "The Seine flows through Paris."), {0.7f, 0.7f});
  }
};

TEST_F(RagServiceTest, SearchEmbedsQueryAndRanks) {
  RagService service(services_, {}, 4);
  EXPECT_CALL(*embedder_, embed("capital of France")).WillOnce(Return(Embedding{1.0f, 0.0f}));

  RetrievalResult results = service.search("capital of France", 2);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.metadata.source, "france.md");
  EXPECT_EQ(results[1].chunk.metadata.source, "rivers.md");
}

TEST_F(RagServiceTest, SearchUsesDefaultTopK) {
  RagService service(services_, {}, 1);
  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Return(Embedding{0.0f, 1.0f}));

  RetrievalResult results = service.search("pasta");
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].chunk.metadata.source, "cooking.md");
}

TEST_F(RagServiceTest, AskComposesGroundedPrompt) {
  RagService service(services_, {}, 2);
  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Return(Embedding{1.0f, 0.0f}));
  std::string seen_prompt;
  EXPECT_CALL(*generator_, generate(_)).WillOnce([&](const std::string& prompt) {
    seen_prompt = prompt;
    return std::string("Paris.");
  });

  Answer answer = service.ask("What is the capital of France?");

  EXPECT_EQ(answer.text, "Paris.");
  EXPECT_EQ(answer.prompt, seen_prompt);
  ASSERT_EQ(answer.sources.size(), 2u);
  EXPECT_THAT(seen_prompt, HasSubstr("Paris is the capital of France."));
  EXPECT_THAT(seen_prompt, HasSubstr("Question: What is the capital of France?"));
  EXPECT_THAT(seen_prompt, testing::Not(HasSubstr("Boil pasta")));
}

TEST_F(RagServiceTest, AskOnEmptyStoreStillGenerates) {
  auto empty_store = std::make_shared<DocumentStore>();
  auto services =
      std::make_shared<ServiceProvider>(empty_store, embedder_, generator_, extractor_factory_);
  RagService service(services);
  EXPECT_CALL(*generator_, generate(HasSubstr("(no context found)")))
      .WillOnce(Return("I don't know."));

  Answer answer = service.ask("Anything?");
  EXPECT_TRUE(answer.sources.empty());
  EXPECT_EQ(answer.text, "I don't know.");
}

TEST_F(RagServiceTest, ProviderFailuresPropagate) {
  RagService service(services_);
  EXPECT_CALL(*embedder_, embed(_)).WillOnce(testing::Throw(RateLimited("slow down")));
  EXPECT_THROW(service.ask("q"), RateLimited);

  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Return(Embedding{1.0f, 0.0f}));
  EXPECT_CALL(*generator_, generate(_)).WillOnce(testing::Throw(ProviderError("bad model")));
  EXPECT_THROW(service.ask("q"), ProviderError);
}

TEST_F(RagServiceTest, RejectsBadTopK) {
  EXPECT_THROW(RagService(services_, {}, 0), InvalidConfiguration);

  RagService service(services_);
  EXPECT_CALL(*embedder_, embed(_)).Times(0);
  EXPECT_THROW(service.search("q", 0), InvalidConfiguration);
}

TEST_F(RagServiceTest, WrongQueryDimensionThrows) {
  RagService service(services_);
  EXPECT_CALL(*embedder_, embed(_)).WillOnce(Return(Embedding{1.0f, 0.0f, 0.0f}));
  EXPECT_THROW(service.search("q"), DimensionMismatch);
}

}  // namespace lore_core
