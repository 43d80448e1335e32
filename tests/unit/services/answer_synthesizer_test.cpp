#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "askdoc_core/errors.hpp"
#include "askdoc_core/services/answer_synthesizer.hpp"
#include "common/mocks_test.hpp"

namespace askdoc_core {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::Throw;

class AnswerSynthesizerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    language_model_ = std::make_shared<NiceMock<askdoc_tests::MockLanguageModelClient>>();
  }

  static ScoredChunk scored(int document_id, int chunk_index, const std::string &content,
                            float score, size_t token_count = 10) {
    ScoredChunk result;
    result.chunk.document_id = document_id;
    result.chunk.chunk_index = chunk_index;
    result.chunk.content = content;
    result.chunk.token_count = token_count;
    result.chunk.page_numbers = {1};
    result.score = score;
    return result;
  }

  static GenerationResult generation(const std::string &answer,
                                     std::optional<float> confidence,
                                     std::vector<ChunkKey> used = {}) {
    GenerationResult result;
    result.answer = answer;
    result.confidence = confidence;
    result.used_chunks = std::move(used);
    return result;
  }

  std::shared_ptr<NiceMock<askdoc_tests::MockLanguageModelClient>> language_model_;
};

TEST_F(AnswerSynthesizerTest, NoChunks_ReturnsFixedAnswerWithoutModelCall) {
  AnswerSynthesizer synthesizer(language_model_);
  EXPECT_CALL(*language_model_, generate(_, _)).Times(0);

  QueryResult result = synthesizer.synthesize("anything?", {});

  EXPECT_EQ(result.answer, AnswerSynthesizer::NO_CONTENT_ANSWER);
  EXPECT_FLOAT_EQ(result.confidence, 0.0f);
  EXPECT_TRUE(result.citations.empty());
  EXPECT_EQ(result.chunks_used, 0u);
}

TEST_F(AnswerSynthesizerTest, ModelConfidence_IsUsedWhenValid) {
  AnswerSynthesizer synthesizer(language_model_);
  EXPECT_CALL(*language_model_, generate(_, _))
      .WillOnce(Return(generation("Paris.", 0.8f, {{1, 0}})));

  auto result = synthesizer.synthesize("Capital?", {scored(1, 0, "Paris is the capital.", 0.4f)});

  EXPECT_EQ(result.answer, "Paris.");
  EXPECT_FLOAT_EQ(result.confidence, 0.8f);
  EXPECT_FALSE(result.confidence_derived);
}

TEST_F(AnswerSynthesizerTest, MissingConfidence_IsDerivedFromTopScore) {
  AnswerSynthesizer synthesizer(language_model_);
  EXPECT_CALL(*language_model_, generate(_, _))
      .WillOnce(Return(generation("Paris.", std::nullopt, {{1, 0}})));

  auto result = synthesizer.synthesize(
      "Capital?", {scored(1, 0, "Paris is the capital.", 0.73f), scored(1, 1, "Other.", 0.2f)});

  EXPECT_FLOAT_EQ(result.confidence, 0.73f);
  EXPECT_TRUE(result.confidence_derived);
}

TEST_F(AnswerSynthesizerTest, DerivedConfidence_IsClampedToUnitRange) {
  EXPECT_FLOAT_EQ(AnswerSynthesizer::derive_confidence({scored(1, 0, "x", -0.3f)}), 0.0f);
  EXPECT_FLOAT_EQ(AnswerSynthesizer::derive_confidence({scored(1, 0, "x", 1.0001f)}), 1.0f);
  EXPECT_FLOAT_EQ(AnswerSynthesizer::derive_confidence({}), 0.0f);
}

TEST_F(AnswerSynthesizerTest, Context_IsCappedByChunkCount) {
  AnswerSynthesizer synthesizer(language_model_, SynthesisConfig{2, 3000});
  std::vector<ScoredChunk> ranked = {scored(1, 0, "a", 0.9f), scored(1, 1, "b", 0.8f),
                                     scored(1, 2, "c", 0.7f)};
  EXPECT_CALL(*language_model_, generate(_, SizeIs(2)))
      .WillOnce(Return(generation("a and b", 0.5f, {{1, 0}})));

  auto result = synthesizer.synthesize("q", ranked);

  EXPECT_EQ(result.chunks_used, 2u);
}

TEST_F(AnswerSynthesizerTest, Context_StopsAtTokenBudget) {
  AnswerSynthesizer synthesizer(language_model_, SynthesisConfig{5, 25});
  std::vector<ScoredChunk> ranked = {scored(1, 0, "a", 0.9f, 10), scored(1, 1, "b", 0.8f, 10),
                                     scored(1, 2, "c", 0.7f, 10)};

  auto context = synthesizer.build_context(ranked);

  ASSERT_EQ(context.size(), 2u);
  EXPECT_EQ(context[0].label, 1);
  EXPECT_EQ(context[1].label, 2);
  EXPECT_EQ(context[1].key(), (ChunkKey{1, 1}));
}

TEST_F(AnswerSynthesizerTest, Context_AlwaysKeepsTopChunk) {
  AnswerSynthesizer synthesizer(language_model_, SynthesisConfig{5, 5});

  auto context = synthesizer.build_context({scored(1, 0, "big", 0.9f, 50), scored(1, 1, "b", 0.8f, 1)});

  ASSERT_EQ(context.size(), 1u);
  EXPECT_EQ(context[0].key(), (ChunkKey{1, 0}));
}

TEST_F(AnswerSynthesizerTest, Citations_KeepOnlyChunksFromContext) {
  AnswerSynthesizer synthesizer(language_model_);
  EXPECT_CALL(*language_model_, generate(_, _))
      .WillOnce(Return(generation("answer", 0.9f, {{1, 1}, {7, 7}})));

  auto result = synthesizer.synthesize(
      "q", {scored(1, 0, "first", 0.9f), scored(1, 1, "second chunk", 0.6f)});

  ASSERT_EQ(result.citations.size(), 1u);
  EXPECT_EQ(result.citations[0].document_id, 1);
  EXPECT_EQ(result.citations[0].chunk_index, 1);
  EXPECT_EQ(result.citations[0].text, "second chunk");
  EXPECT_FLOAT_EQ(result.citations[0].score, 0.6f);
  EXPECT_EQ(result.citations[0].page_numbers, (std::vector<int>{1}));
}

TEST_F(AnswerSynthesizerTest, UnreportedCitations_AreMatchedByContent) {
  AnswerSynthesizer synthesizer(language_model_);
  EXPECT_CALL(*language_model_, generate(_, _))
      .WillOnce(Return(generation("The Eiffel tower stands in Paris, France.", 0.9f)));

  auto result = synthesizer.synthesize(
      "Where is the tower?",
      {scored(2, 0, "Berlin has a television tower.", 0.9f),
       scored(3, 4, "The tower is located in Paris, France, since 1889.", 0.8f)});

  ASSERT_EQ(result.citations.size(), 1u);
  EXPECT_EQ(result.citations[0].document_id, 3);
  EXPECT_EQ(result.citations[0].chunk_index, 4);
}

TEST_F(AnswerSynthesizerTest, NoMatchingContent_CitesTopChunk) {
  std::vector<ContextChunk> context = {{1, 5, 0, "alpha beta", {}, 2, 0.7f},
                                       {2, 6, 0, "gamma delta", {}, 2, 0.6f}};

  auto cited = AnswerSynthesizer::match_citations("Completely unrelated wording here", context);

  ASSERT_EQ(cited.size(), 1u);
  EXPECT_EQ(cited[0], (ChunkKey{5, 0}));
}

TEST_F(AnswerSynthesizerTest, ModelFailure_Propagates) {
  AnswerSynthesizer synthesizer(language_model_);
  EXPECT_CALL(*language_model_, generate(_, _)).WillOnce(Throw(SynthesisError("model offline")));

  EXPECT_THROW(synthesizer.synthesize("q", {scored(1, 0, "text", 0.5f)}), SynthesisError);
}

TEST_F(AnswerSynthesizerTest, EmptyModelAnswer_Throws) {
  AnswerSynthesizer synthesizer(language_model_);
  EXPECT_CALL(*language_model_, generate(_, _)).WillOnce(Return(generation("", 0.5f)));

  EXPECT_THROW(synthesizer.synthesize("q", {scored(1, 0, "text", 0.5f)}), SynthesisError);
}

TEST_F(AnswerSynthesizerTest, InvalidConfig_Throws) {
  EXPECT_THROW(AnswerSynthesizer(language_model_, SynthesisConfig{0, 100}), ConfigurationError);
  EXPECT_THROW(AnswerSynthesizer(language_model_, SynthesisConfig{3, 0}), ConfigurationError);
}

}  // namespace askdoc_core
