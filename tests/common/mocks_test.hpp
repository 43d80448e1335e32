#pragma once

#include <gmock/gmock.h>

#include "askdoc_core/llm/embedding_client.hpp"
#include "askdoc_core/llm/language_model_client.hpp"
#include "askdoc_core/storage/document_repository.hpp"
#include "common/utilities_test.hpp"

namespace askdoc_tests {

/**
 * Mock embedding model. By default every text maps to a deterministic vector
 * derived from the text itself.
 */
class MockEmbeddingClient : public askdoc_core::EmbeddingClient {
 public:
  explicit MockEmbeddingClient(int dimension = TestUtilities::DEFAULT_DIMENSION) {
    ON_CALL(*this, embed(testing::_)).WillByDefault([dimension](const std::string &text) {
      return TestUtilities::create_test_vector(text, dimension);
    });
    ON_CALL(*this, embed_batch(testing::_))
        .WillByDefault([dimension](const std::vector<std::string> &texts) {
          std::vector<std::vector<float>> vectors;
          for (const auto &text : texts) {
            vectors.push_back(TestUtilities::create_test_vector(text, dimension));
          }
          return vectors;
        });
  }

  MOCK_METHOD(std::vector<float>, embed, (const std::string &text), (override));
  MOCK_METHOD(std::vector<std::vector<float>>,
              embed_batch,
              (const std::vector<std::string> &texts),
              (override));
};

/**
 * Mock language model. By default it answers with the first context chunk
 * and reports confidence 0.9 and label 1 as used.
 */
class MockLanguageModelClient : public askdoc_core::LanguageModelClient {
 public:
  MockLanguageModelClient() {
    ON_CALL(*this, generate(testing::_, testing::_))
        .WillByDefault([](const std::string &question,
                          const std::vector<askdoc_core::ContextChunk> &context) {
          askdoc_core::GenerationResult result;
          result.answer = context.empty() ? "I don't know." : "Answer from: " + context[0].text;
          result.confidence = 0.9f;
          result.reasoning = "mock";
          if (!context.empty()) {
            result.used_chunks.push_back(context[0].key());
          }
          return result;
        });
  }

  MOCK_METHOD(askdoc_core::GenerationResult,
              generate,
              (const std::string &question, const std::vector<askdoc_core::ContextChunk> &context),
              (override));
};

class MockDocumentRepository : public askdoc_core::DocumentRepository {
 public:
  MOCK_METHOD(void,
              save,
              (const askdoc_core::Document &document, const std::vector<askdoc_core::Chunk> &chunks),
              (override));
  MOCK_METHOD(bool, remove, (int document_id), (override));
  MOCK_METHOD(bool, contains, (int document_id), (const, override));
  MOCK_METHOD(std::optional<askdoc_core::Document>, get_document, (int document_id), (const, override));
  MOCK_METHOD(std::vector<askdoc_core::Document>, list_documents, (), (const, override));
  MOCK_METHOD(std::vector<askdoc_core::Chunk>,
              get_chunks,
              (const std::vector<askdoc_core::ChunkKey> &keys),
              (const, override));
  MOCK_METHOD(size_t, document_count, (), (const, override));
  MOCK_METHOD(size_t, chunk_count, (), (const, override));
  MOCK_METHOD(std::vector<askdoc_core::StoredDocument>, load_all, (), (const, override));
};

}  // namespace askdoc_tests
