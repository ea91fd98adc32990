// hcl/basic/source_manager.cpp - Line table implementation
//
#include "hcl/basic/source_manager.hpp"

#include <algorithm>

namespace hcl
{

namespace
{

/// UTF-8 continuation bytes do not start a new character.
constexpr bool is_continuation_byte(unsigned char c) noexcept { return (c & 0xC0) == 0x80; }

}  // namespace

SourceFile::SourceFile(std::string_view text) : text_(text)
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceFile::line_column(uint32_t offset) const noexcept
{
  offset = std::min<uint32_t>(offset, static_cast<uint32_t>(text_.size()));

  // upper_bound finds the first line starting after offset
  const auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto line_index = static_cast<size_t>(std::distance(line_starts_.begin(), it) - 1);
  const uint32_t line_start = line_starts_[line_index];

  uint32_t column = 1;
  for (uint32_t i = line_start; i < offset; ++i) {
    if (!is_continuation_byte(static_cast<unsigned char>(text_[i]))) {
      ++column;
    }
  }
  return {static_cast<uint32_t>(line_index + 1), column};
}

std::string_view SourceFile::get_line(size_t line_index) const noexcept
{
  if (line_index >= line_starts_.size()) {
    return {};
  }

  const size_t start = line_starts_[line_index];
  size_t end = (line_index + 1 < line_starts_.size()) ? line_starts_[line_index + 1] - 1
                                                      : text_.size();
  if (end > start && text_[end - 1] == '\r') {
    --end;
  }
  return text_.substr(start, end - start);
}

}  // namespace hcl
