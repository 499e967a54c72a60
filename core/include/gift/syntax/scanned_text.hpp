// gift/syntax/scanned_text.hpp - Lexed text with per-character escape flags
//
// The GIFT parser slices question blocks on reserved characters. Working on
// ScannedText instead of raw strings keeps escaped characters out of every
// structural search: find("::"), split('='), etc. only match characters that
// were not escaped in the source. str() yields the literal text.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "gift/syntax/token.hpp"

namespace gift::syntax
{

class ScannedText
{
public:
  static constexpr size_t npos = std::string::npos;

  ScannedText() = default;

  /// Unescaped text, e.g. a placeholder inserted by the parser.
  explicit ScannedText(std::string_view plain);

  [[nodiscard]] static ScannedText from_tokens(const std::vector<Token> & tokens);

  /// Lex `source` and build the scanned form.
  [[nodiscard]] static ScannedText scan(std::string_view source);

  [[nodiscard]] size_t size() const noexcept { return chars_.size(); }
  [[nodiscard]] bool empty() const noexcept { return chars_.empty(); }

  [[nodiscard]] char at(size_t i) const noexcept { return chars_[i]; }
  [[nodiscard]] bool is_escaped(size_t i) const noexcept { return escaped_[i]; }

  /// True when position `i` holds the unescaped character `c`.
  [[nodiscard]] bool is_syntax(size_t i, char c) const noexcept
  {
    return i < chars_.size() && chars_[i] == c && !escaped_[i];
  }

  [[nodiscard]] size_t find(char c, size_t from = 0) const noexcept;
  [[nodiscard]] size_t find(std::string_view needle, size_t from = 0) const noexcept;
  [[nodiscard]] size_t rfind(char c) const noexcept;
  [[nodiscard]] size_t rfind(std::string_view needle) const noexcept;

  [[nodiscard]] bool contains(char c) const noexcept { return find(c) != npos; }
  [[nodiscard]] bool contains(std::string_view needle) const noexcept
  {
    return find(needle) != npos;
  }

  [[nodiscard]] bool starts_with(std::string_view prefix) const noexcept;
  [[nodiscard]] bool ends_with(char c) const noexcept;

  [[nodiscard]] ScannedText substr(size_t pos, size_t count = npos) const;

  /// Strip unescaped whitespace at both ends (an escaped "\n" survives).
  [[nodiscard]] ScannedText trimmed() const;

  /**
   * Split on unescaped `sep`. With max_parts > 0 the last part keeps the
   * remainder, separators included.
   */
  [[nodiscard]] std::vector<ScannedText> split(char sep, size_t max_parts = 0) const;

  /// split(), trimming each part and dropping the empty ones.
  [[nodiscard]] std::vector<ScannedText> split_nonempty(char sep) const;

  /// Replace every unescaped `c` with the unescaped string `with`.
  [[nodiscard]] ScannedText replace_all(char c, std::string_view with) const;

  ScannedText & append(const ScannedText & other);

  /// The literal characters, escapes resolved.
  [[nodiscard]] const std::string & str() const noexcept { return chars_; }

private:
  void push(char c, bool escaped)
  {
    chars_.push_back(c);
    escaped_.push_back(escaped);
  }

  std::string chars_;
  std::vector<bool> escaped_;
};

}  // namespace gift::syntax
