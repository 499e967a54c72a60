// gift/syntax/token.hpp - Tokens produced by the escape lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "gift/basic/source_manager.hpp"

namespace gift::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Text,    // run of literal characters, none of them escaped
  Escape,  // backslash escape of a reserved character
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;      // byte range in the lexed text (escape: both characters)
  std::string_view text;  // Text: the run itself; Escape: the raw two-character spelling
  char value = '\0';      // Escape: the character it stands for ('\n' for "\n")
};

}  // namespace gift::syntax
