// hcl/ast/ast_enums.hpp - Operator and mode enumerations
//
#pragma once

#include <cstdint>
#include <string_view>

namespace hcl
{

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators.
 */
enum class BinaryOperator : uint8_t {
  // Logical
  Or,   ///< ||
  And,  ///< &&
  // Equality
  Eq,     ///< ==
  NotEq,  ///< !=
  // Comparison
  Less,       ///< <
  LessEq,     ///< <=
  Greater,    ///< >
  GreaterEq,  ///< >=
  // Arithmetic
  Plus,   ///< +
  Minus,  ///< -
  Mul,    ///< *
  Div,    ///< /
  Mod,    ///< %
};

/**
 * Unary operators.
 */
enum class UnaryOperator : uint8_t {
  Neg,  ///< -
  Not,  ///< !
};

/**
 * Heredoc indentation handling.
 */
enum class HeredocStrip : uint8_t {
  None,    ///< <<MARKER
  Indent,  ///< <<-MARKER (common leading indentation is removed)
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOperator op) noexcept
{
  switch (op) {
    case BinaryOperator::Or:
      return "||";
    case BinaryOperator::And:
      return "&&";
    case BinaryOperator::Eq:
      return "==";
    case BinaryOperator::NotEq:
      return "!=";
    case BinaryOperator::Less:
      return "<";
    case BinaryOperator::LessEq:
      return "<=";
    case BinaryOperator::Greater:
      return ">";
    case BinaryOperator::GreaterEq:
      return ">=";
    case BinaryOperator::Plus:
      return "+";
    case BinaryOperator::Minus:
      return "-";
    case BinaryOperator::Mul:
      return "*";
    case BinaryOperator::Div:
      return "/";
    case BinaryOperator::Mod:
      return "%";
  }
  return "?";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOperator op) noexcept
{
  switch (op) {
    case UnaryOperator::Neg:
      return "-";
    case UnaryOperator::Not:
      return "!";
  }
  return "?";
}

/**
 * Binding strength of a binary operator; higher binds tighter.
 * All binary operators are left-associative.
 */
[[nodiscard]] constexpr int precedence(BinaryOperator op) noexcept
{
  switch (op) {
    case BinaryOperator::Or:
      return 1;
    case BinaryOperator::And:
      return 2;
    case BinaryOperator::Eq:
    case BinaryOperator::NotEq:
      return 3;
    case BinaryOperator::Less:
    case BinaryOperator::LessEq:
    case BinaryOperator::Greater:
    case BinaryOperator::GreaterEq:
      return 4;
    case BinaryOperator::Plus:
    case BinaryOperator::Minus:
      return 5;
    case BinaryOperator::Mul:
    case BinaryOperator::Div:
    case BinaryOperator::Mod:
      return 6;
  }
  return 0;
}

}  // namespace hcl
