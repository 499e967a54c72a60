#include "gift/syntax/grammar.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

#include "gift/basic/error.hpp"

namespace gift::syntax
{

namespace
{

bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

constexpr size_t k_max_weight_digits = 3;

std::string unescape_bracket(std::string_view captured)
{
  std::string out;
  out.reserve(captured.size());
  for (size_t i = 0; i < captured.size(); ++i) {
    if (captured[i] == '\\' && i + 1 < captured.size() && captured[i + 1] == ']') {
      out.push_back(']');
      ++i;
      continue;
    }
    out.push_back(captured[i]);
  }
  return std::string(trim(out));
}

}  // namespace

// ============================================================================
// Weights
// ============================================================================

std::optional<WeightPrefix> parse_weight_prefix(const ScannedText & text)
{
  size_t i = 0;
  if (!text.is_syntax(i, '%')) {
    return std::nullopt;
  }
  ++i;

  std::string number;
  if (text.is_syntax(i, '-')) {
    number.push_back('-');
    ++i;
  }

  size_t int_digits = 0;
  while (i < text.size() && is_digit(text.at(i)) && int_digits < k_max_weight_digits) {
    number.push_back(text.at(i));
    ++i;
    ++int_digits;
  }
  if (int_digits == 0) {
    return std::nullopt;
  }

  if (text.is_syntax(i, '.')) {
    number.push_back('.');
    ++i;
    while (i < text.size() && is_digit(text.at(i))) {
      number.push_back(text.at(i));
      ++i;
    }
  }

  if (!text.is_syntax(i, '%')) {
    return std::nullopt;
  }

  const auto percent = parse_number(number);
  if (!percent || std::fabs(*percent) > 100.0) {
    return std::nullopt;
  }

  return WeightPrefix{*percent / 100.0, text.substr(i + 1)};
}

// ============================================================================
// Formats and feedback
// ============================================================================

TextWithFormat parse_text_with_format(const ScannedText & text, TextFormat default_format)
{
  ScannedText body = text.trimmed();
  TextWithFormat out;
  out.format = default_format;

  if (body.is_syntax(0, '[')) {
    const size_t close = body.find(']');
    if (close != ScannedText::npos && close > 0) {
      if (const auto fmt = parse_text_format(body.substr(1, close - 1).str())) {
        out.format = *fmt;
        body = body.substr(close + 1).trimmed();
      }
    }
  }

  out.text = body.str();
  return out;
}

std::pair<TextWithFormat, TextWithFormat> parse_commented(
  const ScannedText & text, TextFormat default_format)
{
  const auto parts = text.split('#', 2);
  TextWithFormat answer = parse_text_with_format(parts[0], default_format);
  TextWithFormat feedback;
  feedback.format = default_format;
  if (parts.size() > 1) {
    feedback = parse_text_with_format(parts[1], default_format);
  }
  return {std::move(answer), std::move(feedback)};
}

// ============================================================================
// Numbers
// ============================================================================

std::optional<double> parse_number(std::string_view text)
{
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }

  // strtod requires a null-terminated string.
  const std::string tmp(text);
  char * end = nullptr;
  errno = 0;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size()) return std::nullopt;
  if (errno == ERANGE || !std::isfinite(v)) return std::nullopt;
  return v;
}

NumericSpec parse_numeric_spec(std::string_view raw, SourceRange range)
{
  raw = trim(raw);
  NumericSpec spec;

  if (raw == "*") {
    return spec;
  }

  if (const size_t dots = raw.find(".."); dots != std::string_view::npos) {
    const auto lo = parse_number(raw.substr(0, dots));
    const auto hi = parse_number(raw.substr(dots + 2));
    if (!lo || !hi) {
      throw GiftError(
        ErrorKind::MalformedNumeric,
        "numerical range must be two numbers: '" + std::string(raw) + "'", range);
    }
    const double mid = (*lo + *hi) / 2.0;
    spec.value = mid;
    spec.tolerance = *hi - mid;
    if (!std::isfinite(mid) || !std::isfinite(spec.tolerance)) {
      throw GiftError(
        ErrorKind::MalformedNumeric, "numerical range overflows: '" + std::string(raw) + "'",
        range);
    }
    return spec;
  }

  if (const size_t colon = raw.find(':'); colon != std::string_view::npos) {
    const auto value = parse_number(raw.substr(0, colon));
    const auto tolerance = parse_number(raw.substr(colon + 1));
    if (!value || !tolerance) {
      throw GiftError(
        ErrorKind::MalformedNumeric,
        "numerical answer and tolerance must be numbers: '" + std::string(raw) + "'", range);
    }
    spec.value = *value;
    spec.tolerance = *tolerance;
    return spec;
  }

  const auto value = parse_number(raw);
  if (!value) {
    throw GiftError(
      ErrorKind::MalformedNumeric,
      "numerical answer must be a number: '" + std::string(raw) + "'", range);
  }
  spec.value = *value;
  return spec;
}

// ============================================================================
// Metadata
// ============================================================================

namespace
{

bool ends_field(char c, bool is_tag) noexcept
{
  if (std::iscntrl(static_cast<unsigned char>(c))) return true;
  return is_tag && (c == '<' || c == '>' || c == '`');
}

/**
 * Raw contents of every `<opener>...]` field in `buffer`. A field stops at the
 * first ']' not preceded by a backslash and must not be empty; a forbidden
 * character abandons it and scanning resumes one past the opener.
 */
std::vector<std::string_view> scan_fields(
  std::string_view buffer, std::string_view opener, bool is_tag)
{
  std::vector<std::string_view> fields;
  size_t pos = buffer.find(opener);
  while (pos != std::string_view::npos) {
    const size_t start = pos + opener.size();
    size_t i = start;
    bool closed = false;
    while (i < buffer.size()) {
      const char c = buffer[i];
      if (c == '\\' && i + 1 < buffer.size() && buffer[i + 1] == ']') {
        i += 2;
        continue;
      }
      if (c == ']') {
        closed = i > start;
        break;
      }
      if (ends_field(c, is_tag)) break;
      ++i;
    }

    if (closed) {
      fields.push_back(buffer.substr(start, i - start));
      pos = buffer.find(opener, i + 1);
    } else {
      pos = buffer.find(opener, pos + 1);
    }
  }
  return fields;
}

}  // namespace

Metadata extract_metadata(std::string_view comments)
{
  Metadata meta;

  const auto ids = scan_fields(comments, "[id:", false);
  if (!ids.empty()) {
    meta.idnumber = unescape_bracket(ids.front());
  }

  for (const auto raw : scan_fields(comments, "[tag:", true)) {
    std::string tag = unescape_bracket(raw);
    if (!tag.empty()) {
      meta.tags.push_back(std::move(tag));
    }
  }
  return meta;
}

// ============================================================================
// Names
// ============================================================================

std::string strip_html_tags(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '<') {
      const size_t close = text.find('>', i + 1);
      if (close != std::string_view::npos) {
        i = close + 1;
        continue;
      }
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

std::string default_question_name(
  std::string_view questiontext, size_t max_chars, std::string_view fallback)
{
  const std::string plain = strip_html_tags(questiontext);

  // Count UTF-8 code points, not bytes, so a multi-byte character is never cut.
  size_t chars = 0;
  size_t end = 0;
  while (end < plain.size()) {
    const auto c = static_cast<unsigned char>(plain[end]);
    if ((c & 0xC0) != 0x80) {
      if (chars == max_chars) break;
      ++chars;
    }
    ++end;
  }

  if (end == 0) {
    return std::string(fallback);
  }
  return plain.substr(0, end);
}

}  // namespace gift::syntax
