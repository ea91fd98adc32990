#pragma once

#include <array>
#include <string_view>

namespace hcl::syntax
{

// Keywords are contextual: they lex as identifiers and are only recognized
// by the parser in the positions listed below.

// Expression literals
inline constexpr std::string_view k_true = "true";
inline constexpr std::string_view k_false = "false";
inline constexpr std::string_view k_null = "null";

// For expressions and template directives
inline constexpr std::string_view k_for = "for";
inline constexpr std::string_view k_in = "in";
inline constexpr std::string_view k_if = "if";
inline constexpr std::string_view k_else = "else";
inline constexpr std::string_view k_endif = "endif";
inline constexpr std::string_view k_endfor = "endfor";

inline constexpr std::array<std::string_view, 3> k_literal_keywords = {k_true, k_false, k_null};

/// Keywords that close a directive body and therefore end template elements.
inline constexpr std::array<std::string_view, 3> k_directive_terminators = {
  k_else,
  k_endif,
  k_endfor,
};

}  // namespace hcl::syntax
