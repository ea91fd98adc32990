// hcl/syntax/frontend.hpp - Parse entry points
#pragma once

#include <expected>
#include <string_view>

#include "hcl/ast/expr.hpp"
#include "hcl/ast/structure.hpp"
#include "hcl/basic/diagnostic.hpp"
#include "hcl/syntax/parser.hpp"

namespace hcl
{

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (model) | ParseError
//
// Each call is independent and owns all of its state.

/// Parse a configuration file body (attributes and blocks).
[[nodiscard]] std::expected<Body, ParseError> parse_body(
  std::string_view source, const ParserOptions & options = {});

/// Parse a single standalone expression; trailing input is an error.
[[nodiscard]] std::expected<Expression, ParseError> parse_expression(
  std::string_view source, const ParserOptions & options = {});

/// Parse bare template text such as the contents of a template file.
[[nodiscard]] std::expected<Template, ParseError> parse_template(
  std::string_view source, const ParserOptions & options = {});

}  // namespace hcl
