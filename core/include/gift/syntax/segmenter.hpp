// gift/syntax/segmenter.hpp - Split a GIFT document into question blocks
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "gift/basic/source_manager.hpp"

namespace gift::syntax
{

struct RawBlock
{
  /// Block lines joined with '\n'; comment lines are replaced by " ".
  std::string body;
  /// Comment lines with the leading "//" removed, one per line.
  std::string comments;
  /// Byte range of the block in the normalized document.
  SourceRange range;
  uint32_t first_line = 0;  ///< 1-indexed

  /// False when the block consisted of comment lines only.
  [[nodiscard]] bool has_content() const noexcept;
};

/// CRLF and lone CR become LF.
[[nodiscard]] std::string normalize_newlines(std::string_view text);

/**
 * Split `normalized` (see normalize_newlines) on whitespace-only lines.
 * Comment-only blocks are kept; callers skip them via has_content().
 */
[[nodiscard]] std::vector<RawBlock> segment_blocks(std::string_view normalized);

}  // namespace gift::syntax
