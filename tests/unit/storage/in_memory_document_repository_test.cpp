#include <gtest/gtest.h>

#include "askdoc_core/errors.hpp"
#include "askdoc_core/storage/in_memory_document_repository.hpp"
#include "common/utilities_test.hpp"

namespace askdoc_core {

using askdoc_tests::TestUtilities;

class InMemoryDocumentRepositoryTest : public ::testing::Test {
 protected:
  InMemoryDocumentRepository repository_;
};

TEST_F(InMemoryDocumentRepositoryTest, Save_ThenReadBack) {
  // Arrange
  auto document = TestUtilities::create_test_document(1, 3);
  auto chunks = TestUtilities::create_test_chunks(1, 3);

  // Act
  repository_.save(document, chunks);

  // Assert
  EXPECT_TRUE(repository_.contains(1));
  auto stored = repository_.get_document(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->title, document.title);
  EXPECT_EQ(stored->chunk_count, 3u);
  EXPECT_EQ(repository_.document_count(), 1u);
  EXPECT_EQ(repository_.chunk_count(), 3u);
}

TEST_F(InMemoryDocumentRepositoryTest, Save_DuplicateId_Throws) {
  repository_.save(TestUtilities::create_test_document(1), TestUtilities::create_test_chunks(1, 2));

  EXPECT_THROW(repository_.save(TestUtilities::create_test_document(1),
                                TestUtilities::create_test_chunks(1, 1)),
               DuplicateDocumentError);
  EXPECT_EQ(repository_.chunk_count(), 2u);
}

TEST_F(InMemoryDocumentRepositoryTest, GetChunks_FollowsKeyOrder_WithoutEmbeddings) {
  repository_.save(TestUtilities::create_test_document(1), TestUtilities::create_test_chunks(1, 3));
  repository_.save(TestUtilities::create_test_document(2), TestUtilities::create_test_chunks(2, 2));

  auto chunks = repository_.get_chunks({{2, 1}, {1, 0}, {9, 9}, {1, 2}});

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].key(), (ChunkKey{2, 1}));
  EXPECT_EQ(chunks[1].key(), (ChunkKey{1, 0}));
  EXPECT_EQ(chunks[2].key(), (ChunkKey{1, 2}));
  EXPECT_EQ(chunks[0].content, "chunk text 2/1");
  for (const auto &chunk : chunks) {
    EXPECT_TRUE(chunk.vector_embedding.empty());
  }
}

TEST_F(InMemoryDocumentRepositoryTest, Remove_IsIdempotent) {
  repository_.save(TestUtilities::create_test_document(1), TestUtilities::create_test_chunks(1, 2));

  EXPECT_TRUE(repository_.remove(1));
  EXPECT_FALSE(repository_.remove(1));
  EXPECT_FALSE(repository_.contains(1));
  EXPECT_EQ(repository_.chunk_count(), 0u);
  EXPECT_TRUE(repository_.get_chunks({{1, 0}}).empty());
}

TEST_F(InMemoryDocumentRepositoryTest, ListDocuments_IsOrderedById) {
  for (int id : {5, 1, 3}) {
    repository_.save(TestUtilities::create_test_document(id), TestUtilities::create_test_chunks(id, 1));
  }

  auto documents = repository_.list_documents();

  ASSERT_EQ(documents.size(), 3u);
  EXPECT_EQ(documents[0].id, 1);
  EXPECT_EQ(documents[1].id, 3);
  EXPECT_EQ(documents[2].id, 5);
}

TEST_F(InMemoryDocumentRepositoryTest, LoadAll_IncludesEmbeddings) {
  auto chunks = TestUtilities::create_test_chunks(4, 2);
  repository_.save(TestUtilities::create_test_document(4), chunks);

  auto all = repository_.load_all();

  ASSERT_EQ(all.size(), 1u);
  ASSERT_EQ(all[0].chunks.size(), 2u);
  EXPECT_EQ(all[0].chunks[1].vector_embedding, chunks[1].vector_embedding);
}

TEST_F(InMemoryDocumentRepositoryTest, UnknownDocument_IsAbsent) {
  EXPECT_FALSE(repository_.get_document(77).has_value());
  EXPECT_FALSE(repository_.contains(77));
}

}  // namespace askdoc_core
