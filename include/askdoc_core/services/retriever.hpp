#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "askdoc_core/index/vector_index.hpp"
#include "askdoc_core/llm/embedding_client.hpp"
#include "askdoc_core/storage/document_repository.hpp"
#include "askdoc_core/types/chunk.hpp"

namespace askdoc_core {

class Retriever {
 public:
  Retriever(std::shared_ptr<EmbeddingClient> embedding_client,
            std::shared_ptr<const VectorIndex> vector_index,
            std::shared_ptr<const DocumentRepository> repository);

  /**
   * @brief Embeds the question and returns the k most similar chunks.
   *
   * Results keep the index ranking, hold each chunk at most once and carry
   * the chunk text. An empty index gives an empty result.
   *
   * @throw EmbeddingUnavailableError if the question cannot be embedded.
   * @throw ConfigurationError if k is negative.
   */
  std::vector<ScoredChunk> retrieve(const std::string &question,
                                    int k,
                                    std::optional<int> document_id_filter = std::nullopt) const;

 private:
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<const VectorIndex> vector_index_;
  std::shared_ptr<const DocumentRepository> repository_;
};

}  // namespace askdoc_core
