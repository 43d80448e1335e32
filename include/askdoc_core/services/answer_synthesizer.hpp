#pragma once

#include <memory>
#include <string>
#include <vector>

#include "askdoc_core/llm/language_model_client.hpp"
#include "askdoc_core/types/chunk.hpp"
#include "askdoc_core/types/query_result.hpp"

namespace askdoc_core {

struct SynthesisConfig {
  int max_chunks_for_context = 5;
  size_t max_context_tokens = 3000;

  // Throws ConfigurationError unless both bounds are positive.
  void validate() const;
};

/**
 * @brief Turns a question and ranked chunks into a cited answer.
 *
 * The context is filled in rank order until max_chunks_for_context chunks
 * are placed or the next chunk would exceed max_context_tokens. The
 * top-ranked chunk is always placed.
 *
 * When the model reports no usable confidence, the confidence is the top
 * retrieval similarity clamped to [0, 1]. When the model names no usable
 * context chunks, citations are recovered by matching answer words against
 * the context.
 */
class AnswerSynthesizer {
 public:
  static constexpr const char *NO_CONTENT_ANSWER =
      "No relevant content was found to answer this question.";
  // Distinct shared content words a chunk needs to be cited post hoc
  static constexpr size_t MIN_SHARED_WORDS = 3;
  static constexpr size_t MIN_WORD_LENGTH = 4;

  AnswerSynthesizer(std::shared_ptr<LanguageModelClient> language_model,
                    SynthesisConfig config = {});

  /**
   * @throw SynthesisError if the model fails or returns no answer. The model
   *        is not called when ranked_chunks is empty.
   */
  QueryResult synthesize(const std::string &question,
                         const std::vector<ScoredChunk> &ranked_chunks) const;

  std::vector<ContextChunk> build_context(const std::vector<ScoredChunk> &ranked_chunks) const;

  static float derive_confidence(const std::vector<ScoredChunk> &ranked_chunks);

  static std::vector<ChunkKey> match_citations(const std::string &answer,
                                               const std::vector<ContextChunk> &context);

 private:
  std::shared_ptr<LanguageModelClient> language_model_;
  SynthesisConfig config_;
};

}  // namespace askdoc_core
