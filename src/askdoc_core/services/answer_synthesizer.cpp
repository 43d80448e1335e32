#include "askdoc_core/services/answer_synthesizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

#include "askdoc_core/chunking/tokenizer.hpp"
#include "askdoc_core/errors.hpp"

namespace askdoc_core {

namespace {

// Lower-cased words of at least min_length bytes. Bytes outside ASCII count
// as word characters so non-Latin words survive.
std::unordered_set<std::string> content_words(const std::string &text, size_t min_length) {
  std::unordered_set<std::string> words;
  std::string current;
  auto flush = [&]() {
    if (current.size() >= min_length) {
      words.insert(current);
    }
    current.clear();
  };
  for (char c : text) {
    unsigned char byte = static_cast<unsigned char>(c);
    if (byte >= 0x80 || std::isalnum(byte)) {
      current.push_back(static_cast<char>(std::tolower(byte)));
    } else {
      flush();
    }
  }
  flush();
  return words;
}

}  // namespace

void SynthesisConfig::validate() const {
  if (max_chunks_for_context <= 0) {
    throw ConfigurationError("max_chunks_for_context must be positive, got " +
                             std::to_string(max_chunks_for_context));
  }
  if (max_context_tokens == 0) {
    throw ConfigurationError("max_context_tokens must be positive");
  }
}

AnswerSynthesizer::AnswerSynthesizer(std::shared_ptr<LanguageModelClient> language_model,
                                     SynthesisConfig config)
    : language_model_(std::move(language_model)), config_(config) {
  config_.validate();
}

std::vector<ContextChunk> AnswerSynthesizer::build_context(
    const std::vector<ScoredChunk> &ranked_chunks) const {
  std::vector<ContextChunk> context;
  size_t used_tokens = 0;
  for (const auto &scored : ranked_chunks) {
    if (context.size() >= static_cast<size_t>(config_.max_chunks_for_context)) {
      break;
    }
    size_t tokens = scored.chunk.token_count > 0 ? scored.chunk.token_count
                                                 : Tokenizer::count_tokens(scored.chunk.content);
    if (!context.empty() && used_tokens + tokens > config_.max_context_tokens) {
      break;
    }
    used_tokens += tokens;

    ContextChunk entry;
    entry.label = static_cast<int>(context.size()) + 1;
    entry.document_id = scored.chunk.document_id;
    entry.chunk_index = scored.chunk.chunk_index;
    entry.text = scored.chunk.content;
    entry.page_numbers = scored.chunk.page_numbers;
    entry.token_count = tokens;
    entry.score = scored.score;
    context.push_back(std::move(entry));
  }
  return context;
}

float AnswerSynthesizer::derive_confidence(const std::vector<ScoredChunk> &ranked_chunks) {
  if (ranked_chunks.empty()) {
    return 0.0f;
  }
  float top = ranked_chunks.front().score;
  if (!std::isfinite(top)) {
    return 0.0f;
  }
  return std::clamp(top, 0.0f, 1.0f);
}

std::vector<ChunkKey> AnswerSynthesizer::match_citations(const std::string &answer,
                                                         const std::vector<ContextChunk> &context) {
  std::vector<ChunkKey> matched;
  if (context.empty()) {
    return matched;
  }

  const auto answer_words = content_words(answer, MIN_WORD_LENGTH);
  for (const auto &chunk : context) {
    const auto chunk_words = content_words(chunk.text, MIN_WORD_LENGTH);
    size_t shared = 0;
    for (const auto &word : answer_words) {
      if (chunk_words.count(word) > 0 && ++shared >= MIN_SHARED_WORDS) {
        break;
      }
    }
    if (shared >= MIN_SHARED_WORDS) {
      matched.push_back(chunk.key());
    }
  }

  if (matched.empty()) {
    matched.push_back(context.front().key());
  }
  return matched;
}

QueryResult AnswerSynthesizer::synthesize(const std::string &question,
                                          const std::vector<ScoredChunk> &ranked_chunks) const {
  QueryResult result;
  if (ranked_chunks.empty()) {
    result.answer = NO_CONTENT_ANSWER;
    result.confidence = 0.0f;
    result.confidence_derived = true;
    return result;
  }

  std::vector<ContextChunk> context = build_context(ranked_chunks);
  GenerationResult generation = language_model_->generate(question, context);
  if (generation.answer.empty()) {
    throw SynthesisError("Language model returned an empty answer");
  }

  result.answer = std::move(generation.answer);
  result.reasoning = std::move(generation.reasoning);
  result.chunks_used = context.size();

  if (generation.confidence.has_value() && std::isfinite(*generation.confidence) &&
      *generation.confidence >= 0.0f && *generation.confidence <= 1.0f) {
    result.confidence = *generation.confidence;
    result.confidence_derived = false;
  } else {
    result.confidence = derive_confidence(ranked_chunks);
    result.confidence_derived = true;
  }

  // Keep only chunks that were really in the context, in context order
  std::unordered_set<ChunkKey, ChunkKeyHash> reported(generation.used_chunks.begin(),
                                                      generation.used_chunks.end());
  std::vector<ChunkKey> cited;
  for (const auto &chunk : context) {
    if (reported.count(chunk.key()) > 0) {
      cited.push_back(chunk.key());
    }
  }
  if (cited.empty()) {
    cited = match_citations(result.answer, context);
  }

  for (const auto &key : cited) {
    for (const auto &chunk : context) {
      if (chunk.key() == key) {
        result.citations.push_back(
            {chunk.document_id, chunk.chunk_index, chunk.score, chunk.text, chunk.page_numbers});
        break;
      }
    }
  }
  return result;
}

}  // namespace askdoc_core
