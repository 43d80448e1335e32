#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace askdoc_core {

// Identity of a chunk inside the whole corpus.
struct ChunkKey {
  int document_id = 0;
  int chunk_index = 0;

  bool operator==(const ChunkKey &other) const = default;
};

struct ChunkKeyHash {
  size_t operator()(const ChunkKey &key) const noexcept {
    return std::hash<long long>()((static_cast<long long>(key.document_id) << 32) ^
                                  static_cast<unsigned int>(key.chunk_index));
  }
};

// Output of the chunker, before the chunk is attached to a document.
// Token and character ranges are half-open.
struct ChunkDraft {
  int chunk_index = 0;
  std::string content;
  size_t token_count = 0;
  size_t token_begin = 0;
  size_t token_end = 0;
  size_t char_begin = 0;
  size_t char_end = 0;
  std::vector<int> page_numbers;
};

struct Chunk {
  int document_id = 0;
  int chunk_index = 0;
  std::string content;
  size_t token_count = 0;
  std::vector<int> page_numbers;
  // Empty unless the chunk was loaded together with its embedding.
  std::vector<float> vector_embedding;

  ChunkKey key() const {
    return {document_id, chunk_index};
  }
};

// A chunk together with its similarity to a query.
struct ScoredChunk {
  Chunk chunk;
  float score = 0.0f;
};

}  // namespace askdoc_core
