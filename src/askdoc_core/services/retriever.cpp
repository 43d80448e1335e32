#include "askdoc_core/services/retriever.hpp"

#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "askdoc_core/errors.hpp"

namespace askdoc_core {

Retriever::Retriever(std::shared_ptr<EmbeddingClient> embedding_client,
                     std::shared_ptr<const VectorIndex> vector_index,
                     std::shared_ptr<const DocumentRepository> repository)
    : embedding_client_(std::move(embedding_client)),
      vector_index_(std::move(vector_index)),
      repository_(std::move(repository)) {}

std::vector<ScoredChunk> Retriever::retrieve(const std::string &question,
                                             int k,
                                             std::optional<int> document_id_filter) const {
  if (k < 0) {
    throw ConfigurationError("k must not be negative, got " + std::to_string(k));
  }
  if (k == 0) {
    return {};
  }

  std::vector<float> query_vector = embedding_client_->embed(question);

  std::vector<IndexHit> hits;
  try {
    hits = vector_index_->search(query_vector, k, document_id_filter);
  } catch (const EmptyIndexError &) {
    return {};
  }

  std::vector<ChunkKey> keys;
  std::unordered_map<ChunkKey, float, ChunkKeyHash> scores;
  keys.reserve(hits.size());
  for (const auto &hit : hits) {
    if (scores.emplace(hit.key(), hit.score).second) {
      keys.push_back(hit.key());
    }
  }

  std::vector<Chunk> chunks = repository_->get_chunks(keys);
  std::unordered_map<ChunkKey, Chunk, ChunkKeyHash> by_key;
  for (auto &chunk : chunks) {
    ChunkKey key = chunk.key();
    by_key.emplace(key, std::move(chunk));
  }

  std::vector<ScoredChunk> results;
  results.reserve(keys.size());
  for (const auto &key : keys) {
    auto it = by_key.find(key);
    if (it == by_key.end()) {
      // Removed between search and lookup
      std::cerr << "Warning: chunk " << key.chunk_index << " of document " << key.document_id
                << " is indexed but not stored; skipping." << std::endl;
      continue;
    }
    results.push_back({std::move(it->second), scores[key]});
  }
  return results;
}

}  // namespace askdoc_core
