#pragma once

#include <string_view>
#include <vector>

namespace askdoc_core {

// Byte range of a token inside the tokenized text.
struct Token {
  size_t begin = 0;
  size_t end = 0;
};

/**
 * @brief Deterministic UTF-8 word tokenizer.
 *
 * A token is a run of word characters (ASCII letters, digits, '_' and any
 * non-ASCII code point that is not a space) or a single other symbol, in both
 * cases together with the whitespace that precedes it. Whitespace at the very
 * end of the text forms a token of its own.
 *
 * The tokens are contiguous and cover the whole input, so concatenating them
 * gives back the original text. Tokenizing any substring that starts and ends
 * on token boundaries yields the same tokens.
 */
class Tokenizer {
 public:
  /**
   * @param text Valid UTF-8.
   * @throw ConfigurationError if the text is not valid UTF-8.
   */
  static std::vector<Token> tokenize(std::string_view text);

  static size_t count_tokens(std::string_view text);
};

}  // namespace askdoc_core
