#include "askdoc_core/services/rag_orchestrator.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "askdoc_core/chunking/tokenizer.hpp"
#include "askdoc_core/errors.hpp"
#include "askdoc_core/util/content_hash.hpp"

namespace askdoc_core {

void OrchestratorConfig::validate() const {
  chunking.validate();
  if (default_top_k < 0) {
    throw ConfigurationError("default_top_k must not be negative");
  }
  if (embedding_batch_size == 0) {
    throw ConfigurationError("embedding_batch_size must be positive");
  }
  if (retry.max_attempts < 1) {
    throw ConfigurationError("external_call_max_attempts must be at least 1");
  }
  if (retry.initial_backoff.count() < 0) {
    throw ConfigurationError("external_call_backoff_ms must not be negative");
  }
}

RagOrchestrator::RagOrchestrator(std::shared_ptr<EmbeddingClient> embedding_client,
                                 std::shared_ptr<LanguageModelClient> language_model,
                                 std::shared_ptr<VectorIndex> vector_index,
                                 std::shared_ptr<DocumentRepository> repository,
                                 OrchestratorConfig config,
                                 SynthesisConfig synthesis_config)
    : embedding_client_(embedding_client),
      vector_index_(vector_index),
      repository_(repository),
      config_(std::move(config)),
      retriever_(embedding_client, vector_index, repository),
      synthesizer_(std::move(language_model), synthesis_config) {
  config_.validate();
}

Document RagOrchestrator::ingest(int document_id,
                                 const std::string &raw_text,
                                 const ChunkingConfig &chunking,
                                 const CancellationToken *cancellation) {
  IngestRequest request;
  request.document_id = document_id;
  request.text = raw_text;
  request.chunking = chunking;
  return ingest(request, cancellation);
}

void RagOrchestrator::throw_if_cancelled(int document_id,
                                         const CancellationToken *cancellation) const {
  if (cancellation && cancellation->is_cancelled()) {
    throw IngestCancelledError("Ingest of document " + std::to_string(document_id) +
                               " was cancelled");
  }
}

std::vector<std::vector<float>> RagOrchestrator::embed_drafts(
    int document_id, const std::vector<ChunkDraft> &drafts, const CancellationToken *cancellation) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(drafts.size());

  for (size_t start = 0; start < drafts.size(); start += config_.embedding_batch_size) {
    throw_if_cancelled(document_id, cancellation);

    const size_t end = std::min(drafts.size(), start + config_.embedding_batch_size);
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      texts.push_back(drafts[i].content);
    }

    auto batch = retry_with_backoff(config_.retry, "chunk embedding",
                                    [&]() { return embedding_client_->embed_batch(texts); });
    if (batch.size() != texts.size()) {
      throw EmbeddingUnavailableError("Embedding service returned " +
                                      std::to_string(batch.size()) + " vectors for " +
                                      std::to_string(texts.size()) + " chunks");
    }
    for (auto &vector : batch) {
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

void RagOrchestrator::rollback(int document_id) {
  try {
    size_t removed = vector_index_->remove(document_id);
    std::cerr << "Rolled back document " << document_id << " (" << removed
              << " index entries removed)" << std::endl;
  } catch (const std::exception &e) {
    throw RollbackError("Rollback of document " + std::to_string(document_id) +
                        " failed: " + e.what());
  }
}

Document RagOrchestrator::ingest(const IngestRequest &request,
                                 const CancellationToken *cancellation) {
  const int document_id = request.document_id;
  const ChunkingConfig chunking = request.chunking.value_or(config_.chunking);
  chunking.validate();

  auto document_guard = document_locks_.lock(document_id);

  if (vector_index_->contains(document_id) || repository_->contains(document_id)) {
    std::cerr << "Ingest rejected: document " << document_id << " already exists" << std::endl;
    throw DuplicateDocumentError("Document " + std::to_string(document_id) + " already exists");
  }

  std::vector<ChunkDraft> drafts;
  try {
    drafts = Chunker::chunk(request.text, chunking, request.page_offsets);
  } catch (const AskdocError &e) {
    std::cerr << "Chunking failed for document " << document_id << ": " << e.what() << std::endl;
    throw;
  }
  if (drafts.empty()) {
    throw EmptyDocumentError("Document " + std::to_string(document_id) + " contains no text");
  }

  Document document;
  document.id = document_id;
  document.title = request.title.empty() ? "Document " + std::to_string(document_id)
                                         : request.title;
  document.chunk_count = drafts.size();
  document.token_count = Tokenizer::count_tokens(request.text);
  if (request.page_count > 0) {
    document.page_count = request.page_count;
  } else {
    document.page_count =
        request.page_offsets.empty() ? 1 : static_cast<int>(request.page_offsets.size());
  }
  document.content_hash = compute_content_hash(request.text);
  document.created_at = std::chrono::system_clock::now();

  try {
    std::vector<std::vector<float>> vectors = embed_drafts(document_id, drafts, cancellation);
    throw_if_cancelled(document_id, cancellation);

    std::vector<VectorEntry> entries;
    std::vector<Chunk> chunks;
    entries.reserve(drafts.size());
    chunks.reserve(drafts.size());
    for (size_t i = 0; i < drafts.size(); ++i) {
      entries.push_back({drafts[i].chunk_index, vectors[i]});

      Chunk chunk;
      chunk.document_id = document_id;
      chunk.chunk_index = drafts[i].chunk_index;
      chunk.content = drafts[i].content;
      chunk.token_count = drafts[i].token_count;
      chunk.page_numbers = drafts[i].page_numbers;
      chunk.vector_embedding = std::move(vectors[i]);
      chunks.push_back(std::move(chunk));
    }

    vector_index_->insert(document_id, entries);
    repository_->save(document, chunks);
  } catch (const std::exception &e) {
    std::cerr << "Ingest failed for document " << document_id << ": " << e.what() << std::endl;
    rollback(document_id);
    throw;
  }

  std::cout << "Ingested document " << document_id << " (" << document.chunk_count
            << " chunks, " << document.token_count << " tokens)" << std::endl;
  return document;
}

QueryResult RagOrchestrator::query(const std::string &question,
                                   std::optional<int> document_id_filter,
                                   std::optional<int> k) {
  const int top_k = k.value_or(config_.default_top_k);
  try {
    if (top_k < 0) {
      throw ConfigurationError("k must not be negative, got " + std::to_string(top_k));
    }

    std::vector<ScoredChunk> ranked = retry_with_backoff(config_.retry, "query embedding", [&]() {
      return retriever_.retrieve(question, top_k, document_id_filter);
    });

    return retry_with_backoff(config_.retry, "answer generation",
                              [&]() { return synthesizer_.synthesize(question, ranked); });
  } catch (const std::exception &e) {
    std::cerr << "Query failed (question: \"" << question << "\"";
    if (document_id_filter.has_value()) {
      std::cerr << ", document " << *document_id_filter;
    }
    std::cerr << "): " << e.what() << std::endl;
    throw;
  }
}

bool RagOrchestrator::remove_document(int document_id) {
  auto document_guard = document_locks_.lock(document_id);
  try {
    size_t removed_entries = vector_index_->remove(document_id);
    bool removed_record = repository_->remove(document_id);
    if (removed_entries > 0 || removed_record) {
      std::cout << "Removed document " << document_id << " (" << removed_entries
                << " index entries)" << std::endl;
      return true;
    }
    return false;
  } catch (const std::exception &e) {
    std::cerr << "Removing document " << document_id << " failed: " << e.what() << std::endl;
    throw;
  }
}

OrchestratorStats RagOrchestrator::stats() const {
  OrchestratorStats stats;
  stats.document_count = repository_->document_count();
  stats.chunk_count = repository_->chunk_count();

  IndexStats index_stats = vector_index_->stats();
  stats.index_entry_count = index_stats.entry_count;
  stats.index_document_count = index_stats.document_count;
  stats.dimension = index_stats.dimension;
  stats.index_memory_bytes = index_stats.memory_bytes;
  return stats;
}

std::vector<Document> RagOrchestrator::list_documents() const {
  return repository_->list_documents();
}

std::optional<Document> RagOrchestrator::get_document(int document_id) const {
  return repository_->get_document(document_id);
}

size_t RagOrchestrator::restore() {
  size_t restored = 0;
  for (const auto &stored : repository_->load_all()) {
    const int document_id = stored.document.id;
    auto document_guard = document_locks_.lock(document_id);
    if (vector_index_->contains(document_id)) {
      continue;
    }
    if (!stored.complete) {
      std::cerr << "Warning: stored document " << document_id
                << " has unreadable chunks; skipping." << std::endl;
      continue;
    }
    if (stored.chunks.empty()) {
      std::cerr << "Warning: stored document " << document_id << " has no chunks; skipping."
                << std::endl;
      continue;
    }

    std::vector<VectorEntry> entries;
    entries.reserve(stored.chunks.size());
    bool complete = true;
    for (const auto &chunk : stored.chunks) {
      if (chunk.vector_embedding.empty()) {
        complete = false;
        break;
      }
      entries.push_back({chunk.chunk_index, chunk.vector_embedding});
    }
    if (!complete) {
      std::cerr << "Warning: stored document " << document_id
                << " has chunks without embeddings; skipping." << std::endl;
      continue;
    }

    try {
      vector_index_->insert(document_id, entries);
    } catch (const AskdocError &e) {
      std::cerr << "Restoring document " << document_id << " failed: " << e.what() << std::endl;
      throw;
    }
    ++restored;
  }

  std::cout << "Restored " << restored << " documents into the vector index" << std::endl;
  return restored;
}

}  // namespace askdoc_core
