// hcl/syntax/frontend.cpp - Parse entry points
#include "hcl/syntax/frontend.hpp"

namespace hcl
{

std::expected<Body, ParseError> parse_body(std::string_view source, const ParserOptions & options)
{
  syntax::Parser parser(source, options);
  return parser.parse_body();
}

std::expected<Expression, ParseError> parse_expression(
  std::string_view source, const ParserOptions & options)
{
  syntax::Parser parser(source, options);
  return parser.parse_expression();
}

std::expected<Template, ParseError> parse_template(
  std::string_view source, const ParserOptions & options)
{
  syntax::Parser parser(source, options);
  return parser.parse_template();
}

}  // namespace hcl
