// gift/basic/source_manager.hpp - Positions inside the input document
//
// Errors point at the question block that produced them. Positions are byte
// offsets into the newline-normalized document; SourceFile turns them into
// line/column pairs for display.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace gift
{

// ============================================================================
// SourceLocation / SourceRange
// ============================================================================

/// Byte offset into the document, or invalid when unknown.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }

private:
  uint32_t offset_ = k_invalid_offset;
};

/// Half-open byte range [begin, end). Default-constructed ranges are invalid.
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(uint32_t begin_offset, uint32_t end_offset) noexcept
  : begin_(begin_offset), end_(end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return begin_ == other.begin_ && end_ == other.end_;
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// 1-indexed line and column; zero means unknown.
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;
};

// ============================================================================
// SourceFile
// ============================================================================

/// One input document together with the offsets of its line starts.
class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }

  /// Offsets past the end are clamped to the end of the document.
  [[nodiscard]] LineColumn locate(SourceLocation loc) const noexcept;

  /// Text of the 1-indexed line `line`, without its terminator.
  [[nodiscard]] std::string_view line_text(uint32_t line) const noexcept;

private:
  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_starts_;
};

}  // namespace gift
