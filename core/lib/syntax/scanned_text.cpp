#include "gift/syntax/scanned_text.hpp"

#include "gift/syntax/lexer.hpp"

namespace gift::syntax
{

namespace
{

bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace

ScannedText::ScannedText(std::string_view plain)
{
  for (const char c : plain) {
    push(c, false);
  }
}

ScannedText ScannedText::from_tokens(const std::vector<Token> & tokens)
{
  ScannedText out;
  for (const auto & t : tokens) {
    if (t.kind == TokenKind::Text) {
      for (const char c : t.text) {
        out.push(c, false);
      }
    } else if (t.kind == TokenKind::Escape) {
      out.push(t.value, true);
    }
  }
  return out;
}

ScannedText ScannedText::scan(std::string_view source)
{
  Lexer lexer(source);
  return from_tokens(lexer.lex_all());
}

size_t ScannedText::find(char c, size_t from) const noexcept
{
  for (size_t i = from; i < chars_.size(); ++i) {
    if (is_syntax(i, c)) {
      return i;
    }
  }
  return npos;
}

size_t ScannedText::find(std::string_view needle, size_t from) const noexcept
{
  if (needle.empty() || needle.size() > chars_.size()) {
    return npos;
  }
  for (size_t i = from; i + needle.size() <= chars_.size(); ++i) {
    bool match = true;
    for (size_t k = 0; k < needle.size(); ++k) {
      if (!is_syntax(i + k, needle[k])) {
        match = false;
        break;
      }
    }
    if (match) {
      return i;
    }
  }
  return npos;
}

size_t ScannedText::rfind(char c) const noexcept
{
  for (size_t i = chars_.size(); i > 0; --i) {
    if (is_syntax(i - 1, c)) {
      return i - 1;
    }
  }
  return npos;
}

size_t ScannedText::rfind(std::string_view needle) const noexcept
{
  if (needle.empty() || needle.size() > chars_.size()) {
    return npos;
  }
  for (size_t i = chars_.size() - needle.size() + 1; i > 0; --i) {
    const size_t start = i - 1;
    bool match = true;
    for (size_t k = 0; k < needle.size(); ++k) {
      if (!is_syntax(start + k, needle[k])) {
        match = false;
        break;
      }
    }
    if (match) {
      return start;
    }
  }
  return npos;
}

bool ScannedText::starts_with(std::string_view prefix) const noexcept
{
  return !prefix.empty() && find(prefix) == 0;
}

bool ScannedText::ends_with(char c) const noexcept
{
  return !chars_.empty() && is_syntax(chars_.size() - 1, c);
}

ScannedText ScannedText::substr(size_t pos, size_t count) const
{
  ScannedText out;
  if (pos >= chars_.size()) {
    return out;
  }
  const size_t end = (count == npos || pos + count > chars_.size()) ? chars_.size() : pos + count;
  out.chars_ = chars_.substr(pos, end - pos);
  out.escaped_.assign(escaped_.begin() + static_cast<std::ptrdiff_t>(pos),
                      escaped_.begin() + static_cast<std::ptrdiff_t>(end));
  return out;
}

ScannedText ScannedText::trimmed() const
{
  size_t begin = 0;
  size_t end = chars_.size();
  while (begin < end && !escaped_[begin] && is_space(chars_[begin])) {
    ++begin;
  }
  while (end > begin && !escaped_[end - 1] && is_space(chars_[end - 1])) {
    --end;
  }
  return substr(begin, end - begin);
}

std::vector<ScannedText> ScannedText::split(char sep, size_t max_parts) const
{
  std::vector<ScannedText> parts;
  size_t start = 0;
  while (true) {
    if (max_parts > 0 && parts.size() + 1 == max_parts) {
      break;
    }
    const size_t pos = find(sep, start);
    if (pos == npos) {
      break;
    }
    parts.push_back(substr(start, pos - start));
    start = pos + 1;
  }
  parts.push_back(substr(start));
  return parts;
}

std::vector<ScannedText> ScannedText::split_nonempty(char sep) const
{
  std::vector<ScannedText> parts;
  for (auto & part : split(sep)) {
    ScannedText t = part.trimmed();
    if (!t.empty()) {
      parts.push_back(std::move(t));
    }
  }
  return parts;
}

ScannedText ScannedText::replace_all(char c, std::string_view with) const
{
  ScannedText out;
  for (size_t i = 0; i < chars_.size(); ++i) {
    if (is_syntax(i, c)) {
      for (const char w : with) {
        out.push(w, false);
      }
    } else {
      out.push(chars_[i], escaped_[i]);
    }
  }
  return out;
}

ScannedText & ScannedText::append(const ScannedText & other)
{
  chars_ += other.chars_;
  escaped_.insert(escaped_.end(), other.escaped_.begin(), other.escaped_.end());
  return *this;
}

}  // namespace gift::syntax
