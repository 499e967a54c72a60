#include "gift/syntax/lexer.hpp"

namespace gift::syntax
{

namespace
{

// Second character of an escape sequence -> the character it denotes.
bool decode_escape(char c, char & out) noexcept
{
  if (c == 'n') {
    out = '\n';
    return true;
  }
  if (c != '\n' && is_reserved(c)) {
    out = c;
    return true;
  }
  return false;
}

}  // namespace

bool Lexer::at_escape() const noexcept
{
  char decoded = '\0';
  return peek() == '\\' && pos_ + 1 < src_.size() && decode_escape(peek(1), decoded);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next_token();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(t);
    if (done) break;
  }
  return out;
}

Token Lexer::next_token()
{
  if (eof()) {
    Token t;
    t.kind = TokenKind::Eof;
    t.range = make_range(pos_, pos_);
    return t;
  }
  if (at_escape()) {
    return lex_escape();
  }
  return lex_text();
}

Token Lexer::lex_escape()
{
  const size_t start = pos_;
  Token t;
  t.kind = TokenKind::Escape;
  (void)decode_escape(peek(1), t.value);
  advance(2);
  t.range = make_range(start, pos_);
  t.text = src_.substr(start, 2);
  return t;
}

Token Lexer::lex_text()
{
  const size_t start = pos_;
  // A backslash that does not start an escape is an ordinary character.
  advance(1);
  while (!eof() && !at_escape()) {
    advance(1);
  }

  Token t;
  t.kind = TokenKind::Text;
  t.range = make_range(start, pos_);
  t.text = src_.substr(start, pos_ - start);
  return t;
}

std::vector<Token> tokenize_literal(std::string_view text)
{
  std::vector<Token> out;
  size_t run_start = 0;

  auto flush_run = [&](size_t end) {
    if (end > run_start) {
      Token t;
      t.kind = TokenKind::Text;
      t.range = SourceRange(static_cast<uint32_t>(run_start), static_cast<uint32_t>(end));
      t.text = text.substr(run_start, end - run_start);
      out.push_back(t);
    }
  };

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\r') {
      flush_run(i);
      run_start = i + 1;
      continue;
    }
    if (is_reserved(c)) {
      flush_run(i);
      Token t;
      t.kind = TokenKind::Escape;
      t.range = SourceRange(static_cast<uint32_t>(i), static_cast<uint32_t>(i + 1));
      t.value = c;
      out.push_back(t);
      run_start = i + 1;
    }
  }
  flush_run(text.size());

  Token eof;
  eof.kind = TokenKind::Eof;
  eof.range = SourceRange(static_cast<uint32_t>(text.size()), static_cast<uint32_t>(text.size()));
  out.push_back(eof);
  return out;
}

std::string spell(const std::vector<Token> & tokens)
{
  std::string out;
  for (const auto & t : tokens) {
    switch (t.kind) {
      case TokenKind::Text:
        out.append(t.text);
        break;
      case TokenKind::Escape:
        out.push_back('\\');
        out.push_back(t.value == '\n' ? 'n' : t.value);
        break;
      case TokenKind::Eof:
        break;
    }
  }
  return out;
}

std::string escape_literal(std::string_view text) { return spell(tokenize_literal(text)); }

}  // namespace gift::syntax
