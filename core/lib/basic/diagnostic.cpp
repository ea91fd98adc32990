// hcl/basic/diagnostic.cpp - ParseError / FormatError implementation
//
#include "hcl/basic/diagnostic.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <ostream>
#include <utility>

#include "hcl/basic/diagnostic_printer.hpp"

namespace hcl
{

std::string format_expected_list(const std::vector<Expected> & expected)
{
  std::vector<std::string> items;
  items.reserve(expected.size());

  for (const auto & e : expected) {
    if (e.kind == Expected::Kind::Literal) {
      items.push_back(fmt::format("`{}`", e.text));
    }
  }
  for (const auto & e : expected) {
    if (e.kind == Expected::Kind::Description) {
      items.emplace_back(e.text);
    }
  }

  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += (i + 1 == items.size()) ? " or " : ", ";
    }
    out += items[i];
  }
  return out;
}

ParseError::ParseError(
  std::string category, std::vector<Expected> expected, uint32_t offset, uint32_t line,
  uint32_t column, std::string source_line)
: category_(std::move(category)),
  expected_(std::move(expected)),
  offset_(offset),
  line_(line),
  column_(column),
  source_line_(std::move(source_line))
{
  // Deduplicate, keeping first-seen order
  std::vector<Expected> unique;
  unique.reserve(expected_.size());
  for (const auto & e : expected_) {
    if (std::find(unique.begin(), unique.end(), e) == unique.end()) {
      unique.push_back(e);
    }
  }
  expected_ = std::move(unique);
}

std::string ParseError::cause() const
{
  if (expected_.empty()) {
    return category_;
  }
  return fmt::format("{}; expected {}", category_, format_expected_list(expected_));
}

std::string ParseError::message() const { return render(*this); }

std::ostream & operator<<(std::ostream & os, const ParseError & err)
{
  return os << err.message();
}

std::ostream & operator<<(std::ostream & os, const FormatError & err)
{
  return os << "format error: " << err.message;
}

}  // namespace hcl
