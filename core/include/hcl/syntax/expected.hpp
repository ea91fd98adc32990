// hcl/syntax/expected.hpp - Grammar diagnostic tables
//
// Alternatives recorded while probing the token stream, and the production
// categories attached to failures. All entries are process-wide constants.
//
#pragma once

#include <array>
#include <string_view>

#include "hcl/basic/diagnostic.hpp"

namespace hcl::syntax
{

namespace expect
{

// Literal terminals
inline constexpr Expected k_lbrace = Expected::literal("{");
inline constexpr Expected k_rbrace = Expected::literal("}");
inline constexpr Expected k_lbracket = Expected::literal("[");
inline constexpr Expected k_rbracket = Expected::literal("]");
inline constexpr Expected k_lparen = Expected::literal("(");
inline constexpr Expected k_rparen = Expected::literal(")");
inline constexpr Expected k_eq = Expected::literal("=");
inline constexpr Expected k_colon = Expected::literal(":");
inline constexpr Expected k_comma = Expected::literal(",");
inline constexpr Expected k_quote = Expected::literal("\"");
inline constexpr Expected k_star = Expected::literal("*");
inline constexpr Expected k_minus = Expected::literal("-");
inline constexpr Expected k_bang = Expected::literal("!");
inline constexpr Expected k_underscore = Expected::literal("_");
inline constexpr Expected k_heredoc = Expected::literal("<");
inline constexpr Expected k_ellipsis = Expected::literal("...");
inline constexpr Expected k_fat_arrow = Expected::literal("=>");
inline constexpr Expected k_double_colon = Expected::literal("::");
inline constexpr Expected k_seq_end = Expected::literal("}");
inline constexpr Expected k_directive_open = Expected::literal("%{");
inline constexpr Expected k_in = Expected::literal("in");
inline constexpr Expected k_if = Expected::literal("if");
inline constexpr Expected k_for = Expected::literal("for");
inline constexpr Expected k_else = Expected::literal("else");
inline constexpr Expected k_endif = Expected::literal("endif");
inline constexpr Expected k_endfor = Expected::literal("endfor");

// Abstract categories
inline constexpr Expected k_identifier = Expected::description("identifier");
inline constexpr Expected k_newline = Expected::description("newline");
inline constexpr Expected k_unsigned_integer = Expected::description("unsigned integer");
inline constexpr Expected k_letter = Expected::description("letter");
inline constexpr Expected k_digit = Expected::description("digit");
inline constexpr Expected k_end_of_input = Expected::description("end of input");
inline constexpr Expected k_heredoc_end = Expected::description("heredoc end marker");
inline constexpr Expected k_hex_digit = Expected::description("hexadecimal digit");

// Escape characters accepted after a backslash in quoted strings
inline constexpr std::array<Expected, 7> k_escape_chars = {
  Expected::literal("\\"), Expected::literal("\""), Expected::literal("n"),
  Expected::literal("r"),  Expected::literal("t"),  Expected::literal("u"),
  Expected::literal("U"),
};

/// Characters that can start an expression.
inline constexpr std::array<Expected, 10> k_expression_start = {
  k_quote, k_lbracket, k_lbrace, k_minus, k_bang, k_lparen, k_underscore, k_heredoc,
  k_letter, k_digit,
};

}  // namespace expect

namespace category
{

inline constexpr std::string_view k_invalid_structure = "invalid structure";
inline constexpr std::string_view k_invalid_block_body = "invalid block body";
inline constexpr std::string_view k_invalid_block = "invalid block";
inline constexpr std::string_view k_invalid_block_label = "invalid block label";
inline constexpr std::string_view k_invalid_attribute = "invalid attribute";
inline constexpr std::string_view k_invalid_expression = "invalid expression";
inline constexpr std::string_view k_invalid_number = "invalid number";
inline constexpr std::string_view k_invalid_traversal_operator = "invalid traversal operator";
inline constexpr std::string_view k_invalid_index = "invalid index";
inline constexpr std::string_view k_invalid_object_item = "invalid object item";
inline constexpr std::string_view k_invalid_array_item = "invalid array item";
inline constexpr std::string_view k_invalid_function_call = "invalid function call";
inline constexpr std::string_view k_invalid_parenthesis = "invalid parenthesized expression";
inline constexpr std::string_view k_invalid_conditional = "invalid conditional";
inline constexpr std::string_view k_invalid_for_expression = "invalid for expression";
inline constexpr std::string_view k_invalid_string = "invalid string";
inline constexpr std::string_view k_invalid_escape_sequence = "invalid escape sequence";
inline constexpr std::string_view k_invalid_unicode_escape = "invalid unicode escape";
inline constexpr std::string_view k_invalid_interpolation = "invalid interpolation";
inline constexpr std::string_view k_invalid_directive = "invalid template directive";
inline constexpr std::string_view k_invalid_heredoc = "invalid heredoc";
inline constexpr std::string_view k_invalid_template = "invalid template";

/// Format string; receives the configured maximum depth.
inline constexpr std::string_view k_nesting_too_deep =
  "expression nesting exceeds maximum depth of {}";

}  // namespace category

}  // namespace hcl::syntax
