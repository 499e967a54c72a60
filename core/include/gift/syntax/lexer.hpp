// gift/syntax/lexer.hpp - Escape-aware tokenizer for GIFT text
//
// GIFT reserves : # = { } ~ as syntax. A backslash in front of one of them
// (or of another backslash) makes it literal, and "\n" stands for a newline.
// The lexer turns source text into literal runs and escape tokens; the
// writer goes the other way with tokenize_literal() + spell().
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gift/syntax/token.hpp"

namespace gift::syntax
{

/// True for characters that must be backslash-escaped to appear literally.
[[nodiscard]] constexpr bool is_reserved(char c) noexcept
{
  switch (c) {
    case '\\':
    case ':':
    case '#':
    case '=':
    case '{':
    case '}':
    case '~':
    case '\n':
      return true;
    default:
      return false;
  }
}

class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool at_escape() const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  [[nodiscard]] Token lex_escape();
  [[nodiscard]] Token lex_text();

  [[nodiscard]] static SourceRange make_range(size_t start, size_t end) noexcept
  {
    return {static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
  }

  std::string_view src_;
  size_t pos_ = 0;
};

/**
 * Token stream whose spelling reads back as `text`: reserved characters
 * become Escape tokens, carriage returns are dropped. The returned Text
 * tokens view into `text`.
 */
[[nodiscard]] std::vector<Token> tokenize_literal(std::string_view text);

/// Spell a token stream as GIFT source.
[[nodiscard]] std::string spell(const std::vector<Token> & tokens);

/// Escape literal text for emission (`spell(tokenize_literal(text))`).
[[nodiscard]] std::string escape_literal(std::string_view text);

}  // namespace gift::syntax
