#include "askdoc_core/chunking/tokenizer.hpp"

#include <utf8.h>

#include <cstdint>

#include "askdoc_core/errors.hpp"

namespace askdoc_core {

namespace {

bool is_space(uint32_t cp) {
  switch (cp) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\f':
    case '\v':
    case 0x00A0:  // no-break space
    case 0x2028:  // line separator
    case 0x2029:  // paragraph separator
    case 0x3000:  // ideographic space
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool is_word(uint32_t cp) {
  if (cp >= 0x80) {
    return !is_space(cp);
  }
  return (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || (cp >= '0' && cp <= '9') ||
         cp == '_';
}

}  // namespace

std::vector<Token> Tokenizer::tokenize(std::string_view text) {
  std::vector<Token> tokens;
  if (text.empty()) {
    return tokens;
  }
  if (!utf8::is_valid(text.begin(), text.end())) {
    throw ConfigurationError("Text is not valid UTF-8");
  }

  const auto begin = text.begin();
  const auto end = text.end();
  auto it = begin;

  while (it != end) {
    auto token_start = it;

    // Leading whitespace belongs to the token that follows it
    auto peek = it;
    uint32_t cp = 0;
    while (peek != end) {
      auto before = peek;
      cp = utf8::next(peek, end);
      if (!is_space(cp)) {
        peek = before;
        break;
      }
      it = peek;
    }
    if (it == end) {
      tokens.push_back({static_cast<size_t>(token_start - begin), text.size()});
      break;
    }

    cp = utf8::next(it, end);
    if (is_word(cp)) {
      while (it != end) {
        auto before = it;
        uint32_t next_cp = utf8::next(it, end);
        if (!is_word(next_cp)) {
          it = before;
          break;
        }
      }
    }
    tokens.push_back(
        {static_cast<size_t>(token_start - begin), static_cast<size_t>(it - begin)});
  }
  return tokens;
}

size_t Tokenizer::count_tokens(std::string_view text) {
  return tokenize(text).size();
}

}  // namespace askdoc_core
