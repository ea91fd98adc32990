// hcl/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// Parse-or-throw wrappers: an unexpected outcome throws std::runtime_error
// carrying the rendered diagnostic, which GoogleTest reports as a failure of
// the running test.
//
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "hcl/format/formatter.hpp"
#include "hcl/syntax/frontend.hpp"

namespace hcl::test_support
{

[[nodiscard]] inline Body parse_body_ok(std::string_view src, const ParserOptions & options = {})
{
  auto result = parse_body(src, options);
  if (!result) {
    throw std::runtime_error("unexpected parse error:\n" + result.error().message());
  }
  return std::move(*result);
}

[[nodiscard]] inline Expression parse_expression_ok(
  std::string_view src, const ParserOptions & options = {})
{
  auto result = parse_expression(src, options);
  if (!result) {
    throw std::runtime_error("unexpected parse error:\n" + result.error().message());
  }
  return std::move(*result);
}

[[nodiscard]] inline Template parse_template_ok(
  std::string_view src, const ParserOptions & options = {})
{
  auto result = parse_template(src, options);
  if (!result) {
    throw std::runtime_error("unexpected parse error:\n" + result.error().message());
  }
  return std::move(*result);
}

/// The error of a body parse that is expected to fail.
[[nodiscard]] inline ParseError parse_body_error(
  std::string_view src, const ParserOptions & options = {})
{
  auto result = parse_body(src, options);
  if (result) {
    throw std::runtime_error("input parsed successfully: " + std::string(src));
  }
  return std::move(result).error();
}

/// The error of an expression parse that is expected to fail.
[[nodiscard]] inline ParseError parse_expression_error(
  std::string_view src, const ParserOptions & options = {})
{
  auto result = parse_expression(src, options);
  if (result) {
    throw std::runtime_error("input parsed successfully: " + std::string(src));
  }
  return std::move(result).error();
}

/// Parse a body and render it canonically.
[[nodiscard]] inline std::string reformat(
  std::string_view src, const FormatterOptions & options = {})
{
  return to_string(parse_body_ok(src), options);
}

}  // namespace hcl::test_support
