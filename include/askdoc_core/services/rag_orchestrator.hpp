#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "askdoc_core/chunking/chunker.hpp"
#include "askdoc_core/index/document_lock_table.hpp"
#include "askdoc_core/index/vector_index.hpp"
#include "askdoc_core/llm/embedding_client.hpp"
#include "askdoc_core/llm/language_model_client.hpp"
#include "askdoc_core/services/answer_synthesizer.hpp"
#include "askdoc_core/services/retriever.hpp"
#include "askdoc_core/storage/document_repository.hpp"
#include "askdoc_core/types/document.hpp"
#include "askdoc_core/types/query_result.hpp"
#include "askdoc_core/util/cancellation.hpp"
#include "askdoc_core/util/retry.hpp"

namespace askdoc_core {

struct OrchestratorConfig {
  ChunkingConfig chunking;
  int default_top_k = 5;
  size_t embedding_batch_size = 32;
  RetryPolicy retry;

  void validate() const;
};

struct IngestRequest {
  int document_id = 0;
  std::string title;
  std::string text;
  // 0 means: derived from page_offsets, or 1 without them
  int page_count = 0;
  std::vector<size_t> page_offsets;
  // Overrides the orchestrator's chunking settings for this document
  std::optional<ChunkingConfig> chunking;
};

struct OrchestratorStats {
  size_t document_count = 0;
  size_t chunk_count = 0;
  size_t index_entry_count = 0;
  size_t index_document_count = 0;
  int dimension = 0;
  size_t index_memory_bytes = 0;
  std::string similarity_metric = VectorIndex::SIMILARITY_METRIC;
};

/**
 * @brief Entry point for ingest, query and delete.
 *
 * Ingest runs chunk -> embed (batched) -> index insert -> repository save as
 * one unit. Any failure after the duplicate check, cancellation included,
 * removes the document's index entries again before the error is rethrown.
 * If that cleanup itself fails the caller gets a RollbackError.
 *
 * Errors from components are logged with the document id or question and
 * rethrown unchanged. External calls (embedding, generation) are retried
 * according to the retry policy; nothing else is retried.
 *
 * Operations on the same document id are serialized; everything else may
 * run concurrently.
 */
class RagOrchestrator {
 public:
  RagOrchestrator(std::shared_ptr<EmbeddingClient> embedding_client,
                  std::shared_ptr<LanguageModelClient> language_model,
                  std::shared_ptr<VectorIndex> vector_index,
                  std::shared_ptr<DocumentRepository> repository,
                  OrchestratorConfig config = {},
                  SynthesisConfig synthesis_config = {});

  RagOrchestrator(const RagOrchestrator &) = delete;
  RagOrchestrator &operator=(const RagOrchestrator &) = delete;

  Document ingest(int document_id,
                  const std::string &raw_text,
                  const ChunkingConfig &chunking,
                  const CancellationToken *cancellation = nullptr);

  Document ingest(const IngestRequest &request, const CancellationToken *cancellation = nullptr);

  // k defaults to OrchestratorConfig::default_top_k.
  QueryResult query(const std::string &question,
                    std::optional<int> document_id_filter = std::nullopt,
                    std::optional<int> k = std::nullopt);

  // Returns false when the document was not known. Never throws for an
  // unknown id.
  bool remove_document(int document_id);

  OrchestratorStats stats() const;

  std::vector<Document> list_documents() const;
  std::optional<Document> get_document(int document_id) const;

  // Re-inserts every stored document that is missing from the vector index.
  // Returns the number of documents inserted.
  size_t restore();

  const OrchestratorConfig &config() const {
    return config_;
  }

 private:
  std::vector<std::vector<float>> embed_drafts(int document_id,
                                               const std::vector<ChunkDraft> &drafts,
                                               const CancellationToken *cancellation);
  void throw_if_cancelled(int document_id, const CancellationToken *cancellation) const;
  void rollback(int document_id);

  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<DocumentRepository> repository_;
  OrchestratorConfig config_;
  Retriever retriever_;
  AnswerSynthesizer synthesizer_;
  DocumentLockTable document_locks_;
};

}  // namespace askdoc_core
