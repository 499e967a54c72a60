#include "gift/syntax/segmenter.hpp"

#include <utility>

namespace gift::syntax
{

namespace
{

bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

std::string_view trim(std::string_view s) noexcept
{
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

constexpr std::string_view k_comment_marker = "//";

}  // namespace

bool RawBlock::has_content() const noexcept
{
  for (const char c : body) {
    if (!is_space(c) && c != '\n') {
      return true;
    }
  }
  return false;
}

std::string normalize_newlines(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      out.push_back('\n');
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<RawBlock> segment_blocks(std::string_view normalized)
{
  std::vector<RawBlock> blocks;
  RawBlock current;
  bool open = false;
  uint32_t block_end = 0;

  auto flush = [&]() {
    if (!open) return;
    current.range = SourceRange(current.range.get_begin().get_offset(), block_end);
    blocks.push_back(std::move(current));
    current = RawBlock{};
    open = false;
  };

  size_t line_start = 0;
  uint32_t line_no = 1;
  while (line_start <= normalized.size()) {
    size_t line_end = normalized.find('\n', line_start);
    if (line_end == std::string_view::npos) {
      line_end = normalized.size();
    }
    const std::string_view line = normalized.substr(line_start, line_end - line_start);
    const std::string_view stripped = trim(line);

    if (stripped.empty()) {
      flush();
    } else {
      if (!open) {
        const auto start = static_cast<uint32_t>(line_start);
        current.range = SourceRange(start, start);
        current.first_line = line_no;
        open = true;
      } else {
        current.body.push_back('\n');
      }

      if (stripped.substr(0, k_comment_marker.size()) == k_comment_marker) {
        current.comments.append(stripped.substr(k_comment_marker.size()));
        current.comments.push_back('\n');
        current.body.push_back(' ');
      } else {
        current.body.append(line);
      }
      block_end = static_cast<uint32_t>(line_end);
    }

    if (line_end == normalized.size()) {
      break;
    }
    line_start = line_end + 1;
    ++line_no;
  }
  flush();

  return blocks;
}

}  // namespace gift::syntax
