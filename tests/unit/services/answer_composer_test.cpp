#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/mocks_test.hpp"
#include "lore_core/errors.hpp"
#include "lore_core/services/answer_composer.hpp"

namespace lore_core {

using testing::HasSubstr;
using testing::Not;
using testing::Return;

class AnswerComposerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    generator_ = std::make_shared<testing::StrictMock<lore_tests::MockGenerationProvider>>();
  }

  static RetrievalResult two_chunks() {
    return {{make_chunk("france.md", 0, "Paris is the capital of France."), 0.9},
            {make_chunk("rivers.md", 2, "The Seine flows through Paris."), 0.7}};
  }

  std::shared_ptr<testing::StrictMock<lore_tests::MockGenerationProvider>> generator_;
};

TEST_F(AnswerComposerTest, PromptContainsQuestionAndEveryChunkInOrder) {
  std::string prompt = AnswerComposer::compose("What is the capital of France?", two_chunks());

  EXPECT_THAT(prompt, HasSubstr("Question: What is the capital of France?\nAnswer:"));
  EXPECT_THAT(prompt, HasSubstr("[Source: france.md]\nParis is the capital of France."));
  EXPECT_THAT(prompt, HasSubstr("[Source: rivers.md]\nThe Seine flows through Paris."));
  EXPECT_THAT(prompt, HasSubstr(AnswerComposer::CONTEXT_DELIMITER));
  EXPECT_LT(prompt.find("france.md"), prompt.find("rivers.md"));
  EXPECT_THAT(prompt, Not(HasSubstr("no context found")));
}

TEST_F(AnswerComposerTest, EmptyRetrievalUsesNoContextTemplate) {
  std::string prompt = AnswerComposer::compose("Who wrote Hamlet?", {});

  EXPECT_THAT(prompt, HasSubstr("(no context found)"));
  EXPECT_THAT(prompt, HasSubstr("Question: Who wrote Hamlet?"));
  EXPECT_THAT(prompt, Not(HasSubstr("[Source:")));
}

TEST_F(AnswerComposerTest, AnswerPassesPromptToGenerator) {
  AnswerComposer composer(generator_);
  RetrievalResult retrieved = two_chunks();
  EXPECT_CALL(*generator_, generate(AnswerComposer::compose("capital?", retrieved)))
      .WillOnce(Return("Paris"));

  EXPECT_EQ(composer.answer("capital?", retrieved), "Paris");
}

TEST_F(AnswerComposerTest, GeneratorFailurePropagatesUnchanged) {
  AnswerComposer composer(generator_);
  EXPECT_CALL(*generator_, generate(testing::_))
      .WillOnce(testing::Throw(ProviderUnavailable("connection refused")));

  EXPECT_THROW(composer.answer("q", {}), ProviderUnavailable);
}

TEST_F(AnswerComposerTest, RequiresGenerator) {
  EXPECT_THROW(AnswerComposer(nullptr), InvalidConfiguration);
}

}  // namespace lore_core
