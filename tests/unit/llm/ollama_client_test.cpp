#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "askdoc_core/errors.hpp"
#include "askdoc_core/llm/ollama_client.hpp"

namespace askdoc_core {

class OllamaLanguageModelClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    context_ = {
        {1, 10, 0, "The capital of France is Paris.", {1}, 7, 0.91f},
        {2, 10, 3, "Paris hosts the Louvre.", {2, 3}, 5, 0.75f},
        {3, 11, 1, "Unrelated text.", {}, 3, 0.20f},
    };
  }

  std::vector<ContextChunk> context_;
};

TEST_F(OllamaLanguageModelClientTest, Prompt_LabelsEveryContextChunk) {
  std::string prompt = OllamaLanguageModelClient::build_user_prompt("Where is the Louvre?", context_);

  EXPECT_NE(prompt.find("[Context 1] (document 10, chunk 0, page 1):\nThe capital of France is Paris."),
            std::string::npos);
  EXPECT_NE(prompt.find("[Context 2] (document 10, chunk 3, pages 2, 3):"), std::string::npos);
  EXPECT_NE(prompt.find("[Context 3] (document 11, chunk 1):"), std::string::npos);
  EXPECT_NE(prompt.find("Question: Where is the Louvre?"), std::string::npos);
}

TEST_F(OllamaLanguageModelClientTest, ParseResponse_ReadsAllFields) {
  const std::string raw = R"({
    "answer": "The Louvre is in Paris.",
    "confidence": 0.85,
    "reasoning": "Context 2 states it directly.",
    "used_context": [2, 1]
  })";

  GenerationResult result = OllamaLanguageModelClient::parse_response(raw, context_);

  EXPECT_EQ(result.answer, "The Louvre is in Paris.");
  ASSERT_TRUE(result.confidence.has_value());
  EXPECT_FLOAT_EQ(*result.confidence, 0.85f);
  EXPECT_EQ(result.reasoning, "Context 2 states it directly.");
  ASSERT_EQ(result.used_chunks.size(), 2u);
  EXPECT_EQ(result.used_chunks[0], (ChunkKey{10, 3}));
  EXPECT_EQ(result.used_chunks[1], (ChunkKey{10, 0}));
}

TEST_F(OllamaLanguageModelClientTest, ParseResponse_OutOfRangeConfidence_IsDropped) {
  auto high = OllamaLanguageModelClient::parse_response(R"({"answer": "x", "confidence": 1.7})", context_);
  auto negative = OllamaLanguageModelClient::parse_response(R"({"answer": "x", "confidence": -0.2})", context_);
  auto text = OllamaLanguageModelClient::parse_response(R"({"answer": "x", "confidence": "high"})", context_);

  EXPECT_FALSE(high.confidence.has_value());
  EXPECT_FALSE(negative.confidence.has_value());
  EXPECT_FALSE(text.confidence.has_value());
}

TEST_F(OllamaLanguageModelClientTest, ParseResponse_UnknownLabels_AreIgnored) {
  auto result = OllamaLanguageModelClient::parse_response(
      R"({"answer": "x", "used_context": [9, "two", 3]})", context_);

  ASSERT_EQ(result.used_chunks.size(), 1u);
  EXPECT_EQ(result.used_chunks[0], (ChunkKey{11, 1}));
}

TEST_F(OllamaLanguageModelClientTest, ParseResponse_MalformedJson_Throws) {
  EXPECT_THROW(OllamaLanguageModelClient::parse_response("not json at all", context_),
               SynthesisError);
  EXPECT_THROW(OllamaLanguageModelClient::parse_response("[1, 2]", context_), SynthesisError);
}

TEST_F(OllamaLanguageModelClientTest, ParseResponse_MissingAnswer_Throws) {
  EXPECT_THROW(OllamaLanguageModelClient::parse_response(R"({"confidence": 0.5})", context_),
               SynthesisError);
  EXPECT_THROW(OllamaLanguageModelClient::parse_response(R"({"answer": ""})", context_),
               SynthesisError);
  EXPECT_THROW(OllamaLanguageModelClient::parse_response(R"({"answer": 12})", context_),
               SynthesisError);
}

TEST_F(OllamaLanguageModelClientTest, SystemPrompt_AsksForJson) {
  std::string system_prompt = OllamaLanguageModelClient::SYSTEM_PROMPT;

  EXPECT_NE(system_prompt.find("JSON"), std::string::npos);
  EXPECT_NE(system_prompt.find("used_context"), std::string::npos);
}

}  // namespace askdoc_core
