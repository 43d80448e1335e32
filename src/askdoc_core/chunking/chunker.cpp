#include "askdoc_core/chunking/chunker.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

#include "askdoc_core/chunking/tokenizer.hpp"
#include "askdoc_core/errors.hpp"

namespace askdoc_core {

void ChunkingConfig::validate() const {
  if (chunk_size_tokens <= 0) {
    throw ConfigurationError("chunk_size_tokens must be greater than 0, got " +
                             std::to_string(chunk_size_tokens));
  }
  if (overlap_tokens <= 0) {
    throw ConfigurationError("overlap_tokens must be greater than 0, got " +
                             std::to_string(overlap_tokens));
  }
  if (overlap_tokens >= chunk_size_tokens) {
    throw ConfigurationError("overlap_tokens (" + std::to_string(overlap_tokens) +
                             ") must be smaller than chunk_size_tokens (" +
                             std::to_string(chunk_size_tokens) + ")");
  }
}

std::vector<ChunkDraft> Chunker::chunk(std::string_view text,
                                       const ChunkingConfig &config,
                                       const std::vector<size_t> &page_offsets) {
  return chunk(text, config.chunk_size_tokens, config.overlap_tokens, page_offsets);
}

std::vector<ChunkDraft> Chunker::chunk(std::string_view text,
                                       int chunk_size_tokens,
                                       int overlap_tokens,
                                       const std::vector<size_t> &page_offsets) {
  ChunkingConfig{chunk_size_tokens, overlap_tokens}.validate();

  std::vector<ChunkDraft> drafts;
  const std::vector<Token> tokens = Tokenizer::tokenize(text);
  if (tokens.empty()) {
    return drafts;
  }

  const size_t size = static_cast<size_t>(chunk_size_tokens);
  const size_t stride = static_cast<size_t>(chunk_size_tokens - overlap_tokens);
  const size_t total = tokens.size();

  size_t start = 0;
  int chunk_index = 0;
  while (start < total) {
    const size_t end = std::min(start + size, total);

    ChunkDraft draft;
    draft.chunk_index = chunk_index++;
    draft.token_begin = start;
    draft.token_end = end;
    draft.token_count = end - start;
    draft.char_begin = tokens[start].begin;
    draft.char_end = tokens[end - 1].end;
    draft.content = std::string(text.substr(draft.char_begin, draft.char_end - draft.char_begin));
    if (!page_offsets.empty()) {
      draft.page_numbers = pages_for_range(draft.char_begin, draft.char_end, page_offsets);
    }
    drafts.push_back(std::move(draft));

    // The chunk that reaches the end of the text is the last one
    if (end == total) {
      break;
    }
    start += stride;
  }
  return drafts;
}

std::vector<int> Chunker::pages_for_range(size_t char_begin,
                                          size_t char_end,
                                          const std::vector<size_t> &page_offsets) {
  std::vector<int> pages;
  for (size_t i = 0; i < page_offsets.size(); ++i) {
    const size_t page_begin = page_offsets[i];
    const size_t page_end = (i + 1 < page_offsets.size()) ? page_offsets[i + 1] : SIZE_MAX;
    if (page_begin < char_end && char_begin < page_end) {
      pages.push_back(static_cast<int>(i) + 1);
    }
  }
  return pages;
}

}  // namespace askdoc_core
