#pragma once

#include <string_view>
#include <vector>

#include "askdoc_core/types/chunk.hpp"

namespace askdoc_core {

struct ChunkingConfig {
  int chunk_size_tokens = 500;
  int overlap_tokens = 50;

  // Throws ConfigurationError unless 0 < overlap_tokens < chunk_size_tokens.
  void validate() const;
};

/**
 * @brief Splits text into token-bounded, overlapping chunks.
 *
 * A chunk starts every (chunk_size_tokens - overlap_tokens) tokens and spans
 * chunk_size_tokens tokens. The last chunk ends at the end of the text and
 * may be shorter. Consecutive chunks share exactly overlap_tokens tokens.
 */
class Chunker {
 public:
  /**
   * @param text Extracted document text (valid UTF-8).
   * @param page_offsets Optional byte offsets where each page starts, in
   *        ascending order. When given, every chunk lists the 1-based pages
   *        its characters span.
   * @return Drafts in chunk index order. Empty for empty text.
   * @throw ConfigurationError on invalid sizes or invalid UTF-8.
   */
  static std::vector<ChunkDraft> chunk(std::string_view text,
                                       int chunk_size_tokens,
                                       int overlap_tokens,
                                       const std::vector<size_t> &page_offsets = {});

  static std::vector<ChunkDraft> chunk(std::string_view text,
                                       const ChunkingConfig &config,
                                       const std::vector<size_t> &page_offsets = {});

 private:
  static std::vector<int> pages_for_range(size_t char_begin,
                                          size_t char_end,
                                          const std::vector<size_t> &page_offsets);
};

}  // namespace askdoc_core
