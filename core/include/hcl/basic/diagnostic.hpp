// hcl/basic/diagnostic.hpp - Parse and format error values
//
// A parse either yields a complete tree or exactly one ParseError describing
// the furthest point the grammar reached. Errors are values; they are returned
// through std::expected and never thrown.
//
#pragma once

#include <fmt/ostream.h>

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace hcl
{

// ============================================================================
// Expected alternatives
// ============================================================================

/**
 * One alternative the grammar would have accepted at a failure point.
 *
 * Literal alternatives are rendered in backticks (`{`); descriptions are
 * abstract categories rendered verbatim (identifier, newline).
 * The text must refer to static storage.
 */
struct Expected
{
  enum class Kind : uint8_t {
    Literal,
    Description,
  };

  Kind kind = Kind::Literal;
  std::string_view text;

  [[nodiscard]] static constexpr Expected literal(std::string_view t) noexcept
  {
    return {Kind::Literal, t};
  }
  [[nodiscard]] static constexpr Expected description(std::string_view t) noexcept
  {
    return {Kind::Description, t};
  }

  constexpr bool operator==(const Expected &) const noexcept = default;
};

/**
 * Render an expected set in natural-language order: literals first, then
 * descriptions, separated by ", " with " or " before the last item.
 */
[[nodiscard]] std::string format_expected_list(const std::vector<Expected> & expected);

// ============================================================================
// ParseError
// ============================================================================

/**
 * The single failure of a parse.
 *
 * Carries the failure position, the production category that failed and the
 * alternatives accepted at that position. message() (and operator<<) produce
 * the rendered diagnostic.
 */
class ParseError
{
public:
  ParseError(
    std::string category, std::vector<Expected> expected, uint32_t offset, uint32_t line,
    uint32_t column, std::string source_line);

  /// Production that failed, e.g. "invalid block body".
  [[nodiscard]] const std::string & category() const noexcept { return category_; }
  [[nodiscard]] const std::vector<Expected> & expected() const noexcept { return expected_; }

  /// Byte offset of the failure.
  [[nodiscard]] uint32_t offset() const noexcept { return offset_; }
  /// 1-indexed line of the failure.
  [[nodiscard]] uint32_t line() const noexcept { return line_; }
  /// 1-indexed column of the failure, in characters.
  [[nodiscard]] uint32_t column() const noexcept { return column_; }
  /// Full physical line containing the failure, without the line break.
  [[nodiscard]] const std::string & source_line() const noexcept { return source_line_; }

  /// "<category>; expected <alternatives>", or only the category when no
  /// alternatives are known.
  [[nodiscard]] std::string cause() const;

  /// Rendered multi-line diagnostic.
  [[nodiscard]] std::string message() const;

  bool operator==(const ParseError &) const = default;

private:
  std::string category_;
  std::vector<Expected> expected_;
  uint32_t offset_ = 0;
  uint32_t line_ = 1;
  uint32_t column_ = 1;
  std::string source_line_;
};

std::ostream & operator<<(std::ostream & os, const ParseError & err);

// ============================================================================
// FormatError
// ============================================================================

/**
 * Failure of an output sink while writing formatted text.
 *
 * Rendering a well-formed tree into memory cannot fail; only the stream-based
 * entry points report this.
 */
struct FormatError
{
  std::string message;

  bool operator==(const FormatError &) const = default;
};

std::ostream & operator<<(std::ostream & os, const FormatError & err);

}  // namespace hcl

template <>
struct fmt::formatter<hcl::ParseError> : fmt::ostream_formatter
{
};

template <>
struct fmt::formatter<hcl::FormatError> : fmt::ostream_formatter
{
};
