// hcl/basic/source_manager.hpp - Source locations and line tables
//
// Tokens carry byte offsets only. Line and column numbers are derived on
// demand from a SourceFile, which owns a line-start table for one input text.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace hcl
{

/**
 * Byte offset into a source text.
 */
class SourceLocation
{
public:
  constexpr SourceLocation() noexcept = default;
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  constexpr auto operator<=>(const SourceLocation &) const noexcept = default;

private:
  uint32_t offset_ = 0;
};

/**
 * Half-open byte range [begin, end).
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(uint32_t begin, uint32_t end) noexcept : begin_(begin), end_(end) {}

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return end_.get_offset() - begin_.get_offset();
  }

  constexpr bool operator==(const SourceRange &) const noexcept = default;

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/**
 * 1-indexed line and column. Columns count UTF-8 code points, not bytes.
 */
struct LineColumn
{
  uint32_t line = 1;
  uint32_t column = 1;

  bool operator==(const LineColumn &) const = default;
};

/**
 * Line table over a borrowed source text.
 *
 * The text must outlive the SourceFile.
 */
class SourceFile
{
public:
  explicit SourceFile(std::string_view text);

  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Line/column of a byte offset. Offsets past the end clamp to the end.
  [[nodiscard]] LineColumn line_column(uint32_t offset) const noexcept;

  /// Line contents (0-indexed) without the trailing line break.
  [[nodiscard]] std::string_view get_line(size_t line_index) const noexcept;

private:
  std::string_view text_;
  std::vector<uint32_t> line_starts_;
};

}  // namespace hcl
