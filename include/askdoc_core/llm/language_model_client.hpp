#pragma once

#include <optional>
#include <string>
#include <vector>

#include "askdoc_core/types/chunk.hpp"

namespace askdoc_core {

// A chunk as it is shown to the language model.
struct ContextChunk {
  int label = 0;  // 1-based position in the context
  int document_id = 0;
  int chunk_index = 0;
  std::string text;
  std::vector<int> page_numbers;
  size_t token_count = 0;
  float score = 0.0f;

  ChunkKey key() const {
    return {document_id, chunk_index};
  }
};

struct GenerationResult {
  std::string answer;
  // Absent when the model did not report a usable value.
  std::optional<float> confidence;
  std::string reasoning;
  // Context chunks the answer relied on, as reported by the model.
  std::vector<ChunkKey> used_chunks;
};

// Answer-generating language model. Implementations report any failure of
// the underlying service as SynthesisError.
class LanguageModelClient {
 public:
  virtual ~LanguageModelClient() = default;

  virtual GenerationResult generate(const std::string &question,
                                    const std::vector<ContextChunk> &context) = 0;
};

}  // namespace askdoc_core
