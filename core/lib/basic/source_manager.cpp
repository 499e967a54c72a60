// gift/basic/source_manager.cpp - Line table lookups
#include "gift/basic/source_manager.hpp"

#include <algorithm>
#include <utility>

namespace gift
{

SourceFile::SourceFile(std::filesystem::path path, std::string content)
: path_(std::move(path)), content_(std::move(content))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceFile::locate(SourceLocation loc) const noexcept
{
  if (!loc.is_valid() || line_starts_.empty()) {
    return {};
  }

  const auto offset = std::min(loc.get_offset(), static_cast<uint32_t>(content_.size()));
  // line_starts_[0] == 0, so upper_bound never returns begin().
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line = static_cast<uint32_t>(next - line_starts_.begin());
  return {line, offset - line_starts_[line - 1] + 1};
}

std::string_view SourceFile::line_text(uint32_t line) const noexcept
{
  if (line == 0 || line > line_starts_.size()) {
    return {};
  }

  const uint32_t begin = line_starts_[line - 1];
  const uint32_t end = line < line_starts_.size() ? line_starts_[line] - 1
                                                  : static_cast<uint32_t>(content_.size());
  return std::string_view(content_).substr(begin, end - begin);
}

}  // namespace gift
