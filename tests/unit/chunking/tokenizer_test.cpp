#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "askdoc_core/chunking/tokenizer.hpp"
#include "askdoc_core/errors.hpp"

namespace askdoc_core {

class TokenizerTest : public ::testing::Test {
 protected:
  static std::vector<std::string> token_texts(const std::string &text) {
    std::vector<std::string> texts;
    for (const auto &token : Tokenizer::tokenize(text)) {
      texts.push_back(text.substr(token.begin, token.end - token.begin));
    }
    return texts;
  }

  static std::string concatenate(const std::string &text) {
    std::string joined;
    for (const auto &piece : token_texts(text)) {
      joined += piece;
    }
    return joined;
  }
};

TEST_F(TokenizerTest, EmptyText_HasNoTokens) {
  EXPECT_TRUE(Tokenizer::tokenize("").empty());
  EXPECT_EQ(Tokenizer::count_tokens(""), 0u);
}

TEST_F(TokenizerTest, Words_CarryTheirLeadingWhitespace) {
  auto tokens = token_texts("hello big  world");

  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], "hello");
  EXPECT_EQ(tokens[1], " big");
  EXPECT_EQ(tokens[2], "  world");
}

TEST_F(TokenizerTest, Punctuation_IsOneTokenPerSymbol) {
  auto tokens = token_texts("Hi, there!?");

  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0], "Hi");
  EXPECT_EQ(tokens[1], ",");
  EXPECT_EQ(tokens[2], " there");
  EXPECT_EQ(tokens[3], "!");
  EXPECT_EQ(tokens[4], "?");
}

TEST_F(TokenizerTest, TrailingWhitespace_FormsItsOwnToken) {
  auto tokens = token_texts("end \n\n");

  ASSERT_EQ(tokens.size(), 2u);
  EXPECT_EQ(tokens[0], "end");
  EXPECT_EQ(tokens[1], " \n\n");
}

TEST_F(TokenizerTest, WhitespaceOnly_IsSingleToken) {
  EXPECT_EQ(Tokenizer::count_tokens("   \t "), 1u);
}

TEST_F(TokenizerTest, NonAsciiLetters_StayInsideWords) {
  auto tokens = token_texts("h\xC3\xA9llo w\xC3\xB6rld \xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");

  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], "h\xC3\xA9llo");
  EXPECT_EQ(tokens[1], " w\xC3\xB6rld");
  EXPECT_EQ(tokens[2], " \xE6\x97\xA5\xE6\x9C\xAC\xE8\xAA\x9E");
}

TEST_F(TokenizerTest, NoBreakSpace_SeparatesWords) {
  // U+00A0 between two words
  EXPECT_EQ(Tokenizer::count_tokens("one\xC2\xA0two"), 2u);
}

TEST_F(TokenizerTest, Tokens_ConcatenateToOriginalText) {
  const std::vector<std::string> samples = {
      "plain words only",
      "  leading and trailing  ",
      "mixed: punctuation, (brackets) & symbols...",
      "line one\nline two\r\n\ttabbed\fnext page",
      "caf\xC3\xA9 na\xC3\xAFve \xE2\x80\x94 dash",
  };

  for (const auto &sample : samples) {
    EXPECT_EQ(concatenate(sample), sample) << "sample: " << sample;
  }
}

TEST_F(TokenizerTest, TokenRanges_AreContiguous) {
  const std::string text = "a b, c.  d";
  auto tokens = Tokenizer::tokenize(text);

  ASSERT_FALSE(tokens.empty());
  EXPECT_EQ(tokens.front().begin, 0u);
  for (size_t i = 1; i < tokens.size(); ++i) {
    EXPECT_EQ(tokens[i].begin, tokens[i - 1].end);
  }
  EXPECT_EQ(tokens.back().end, text.size());
}

TEST_F(TokenizerTest, SubstringOnTokenBoundaries_TokenizesTheSame) {
  const std::string text = "alpha beta, gamma delta epsilon";
  auto tokens = Tokenizer::tokenize(text);
  ASSERT_GE(tokens.size(), 5u);

  const size_t begin = tokens[1].begin;
  const size_t end = tokens[4].end;
  auto sub_tokens = Tokenizer::tokenize(std::string_view(text).substr(begin, end - begin));

  ASSERT_EQ(sub_tokens.size(), 4u);
  for (size_t i = 0; i < sub_tokens.size(); ++i) {
    EXPECT_EQ(sub_tokens[i].begin + begin, tokens[i + 1].begin);
    EXPECT_EQ(sub_tokens[i].end + begin, tokens[i + 1].end);
  }
}

TEST_F(TokenizerTest, InvalidUtf8_Throws) {
  EXPECT_THROW(Tokenizer::tokenize("bad \xC3 byte"), ConfigurationError);
  EXPECT_THROW(Tokenizer::count_tokens("\xFF\xFE"), ConfigurationError);
}

}  // namespace askdoc_core
