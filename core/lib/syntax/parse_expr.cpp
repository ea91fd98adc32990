// hcl/syntax/parse_expr.cpp - Expression productions
//
#include <utility>

#include "hcl/syntax/expected.hpp"
#include "hcl/syntax/keywords.hpp"
#include "hcl/syntax/parser.hpp"
#include "parser_scopes.hpp"

namespace hcl::syntax
{

namespace
{

std::vector<Expected> expression_start()
{
  return {expect::k_expression_start.begin(), expect::k_expression_start.end()};
}

bool is_unsigned_integer(std::string_view text)
{
  if (text.empty()) {
    return false;
  }
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

}  // namespace

// ============================================================================
// Operators
// ============================================================================

Expression Parser::parse_expr()
{
  DepthGuard guard(*this);

  Expression cond = parse_binary(1);
  if (failed() || !at(TokenKind::Question)) {
    return cond;
  }
  advance();

  Expression true_expr = parse_expr();
  if (!check(TokenKind::Colon, expect::k_colon)) {
    fail(category::k_invalid_conditional);
    return cond;
  }
  advance();
  Expression false_expr = parse_expr();

  return Box<Conditional>(
    Conditional{std::move(cond), std::move(true_expr), std::move(false_expr)});
}

std::optional<BinaryOperator> Parser::peek_binary_operator()
{
  switch (cur().kind) {
    case TokenKind::OrOr:
      return BinaryOperator::Or;
    case TokenKind::AndAnd:
      return BinaryOperator::And;
    case TokenKind::EqEq:
      return BinaryOperator::Eq;
    case TokenKind::Ne:
      return BinaryOperator::NotEq;
    case TokenKind::Lt:
      return BinaryOperator::Less;
    case TokenKind::Le:
      return BinaryOperator::LessEq;
    case TokenKind::Gt:
      return BinaryOperator::Greater;
    case TokenKind::Ge:
      return BinaryOperator::GreaterEq;
    case TokenKind::Plus:
      return BinaryOperator::Plus;
    case TokenKind::Minus:
      return BinaryOperator::Minus;
    case TokenKind::Star:
      return BinaryOperator::Mul;
    case TokenKind::Slash:
      return BinaryOperator::Div;
    case TokenKind::Percent:
      return BinaryOperator::Mod;
    default:
      return std::nullopt;
  }
}

/// Precedence climbing; all binary operators are left-associative.
Expression Parser::parse_binary(int min_precedence)
{
  Expression lhs = parse_unary();

  while (!failed()) {
    const auto op = peek_binary_operator();
    if (!op || precedence(*op) < min_precedence) {
      break;
    }
    advance();
    Expression rhs = parse_binary(precedence(*op) + 1);
    lhs = Box<BinaryExpr>(BinaryExpr{std::move(lhs), *op, std::move(rhs)});
  }

  return lhs;
}

Expression Parser::parse_unary()
{
  const TokenKind k = cur().kind;
  if (k != TokenKind::Minus && k != TokenKind::Bang) {
    return parse_postfix(parse_primary());
  }

  DepthGuard guard(*this);
  advance();
  const bool number_operand = at(TokenKind::NumberLiteral);
  Expression operand = parse_unary();

  if (k == TokenKind::Minus) {
    // `-1` is a negative number literal, not a negation
    if (const auto * n = std::get_if<Number>(&operand); n && number_operand) {
      return -*n;
    }
    return Box<UnaryExpr>(UnaryExpr{UnaryOperator::Neg, std::move(operand)});
  }
  return Box<UnaryExpr>(UnaryExpr{UnaryOperator::Not, std::move(operand)});
}

// ============================================================================
// Traversals
// ============================================================================

Expression Parser::parse_postfix(Expression base)
{
  std::vector<TraversalOperator> operators;

  while (!failed()) {
    if (at(TokenKind::Dot)) {
      advance();
      if (check(TokenKind::Star, expect::k_star)) {
        advance();
        operators.emplace_back(AttrSplat{});
        continue;
      }
      if (check(TokenKind::Identifier, expect::k_identifier)) {
        operators.emplace_back(GetAttr{make_identifier(cur())});
        advance();
        continue;
      }
      if (check(TokenKind::NumberLiteral, expect::k_unsigned_integer)) {
        const auto n = Number::parse(cur().text);
        if (!is_unsigned_integer(cur().text) || !n || !n->is_u64()) {
          fail(category::k_invalid_traversal_operator);
          break;
        }
        operators.emplace_back(LegacyIndex{*n->as_u64()});
        advance();
        continue;
      }
      fail(category::k_invalid_traversal_operator);
      break;
    }

    if (at(TokenKind::LBracket)) {
      advance();
      NewlineScope scope(*this, true);
      if (at(TokenKind::Star) && cur(1).kind == TokenKind::RBracket) {
        advance();
        advance();
        operators.emplace_back(FullSplat{});
        continue;
      }
      Expression index = parse_expr();
      if (!check(TokenKind::RBracket, expect::k_rbracket)) {
        fail(category::k_invalid_index);
        break;
      }
      advance();
      operators.emplace_back(Index{std::move(index)});
      continue;
    }

    break;
  }

  if (operators.empty()) {
    return base;
  }
  return Box<Traversal>(Traversal{std::move(base), std::move(operators)});
}

// ============================================================================
// Primary expressions
// ============================================================================

Expression Parser::parse_primary()
{
  switch (cur().kind) {
    case TokenKind::NumberLiteral:
      return parse_number();
    case TokenKind::Identifier:
      return parse_identifier_expr();
    case TokenKind::OQuote:
      return parse_quoted_string();
    case TokenKind::HeredocBegin:
      return parse_heredoc();
    case TokenKind::LBracket:
      return parse_tuple();
    case TokenKind::LBrace:
      return parse_object();
    case TokenKind::LParen:
      return parse_parenthesis();
    default:
      fail(category::k_invalid_expression, expression_start());
      return Null{};
  }
}

Expression Parser::parse_number()
{
  const auto n = Number::parse(cur().text);
  if (!n) {
    fail(category::k_invalid_number);
    return Null{};
  }
  advance();
  return *n;
}

Expression Parser::parse_identifier_expr()
{
  const Token & tok = cur();
  const TokenKind next = cur(1).kind;
  if (next == TokenKind::LParen || next == TokenKind::DoubleColon) {
    return parse_func_call();
  }

  advance();
  if (tok.text == k_true) {
    return true;
  }
  if (tok.text == k_false) {
    return false;
  }
  if (tok.text == k_null) {
    return Null{};
  }
  return Variable{make_identifier(tok)};
}

Expression Parser::parse_func_call()
{
  std::vector<Identifier> namespace_path;
  Identifier name = make_identifier(cur());
  advance();

  while (at(TokenKind::DoubleColon)) {
    advance();
    if (!check(TokenKind::Identifier, expect::k_identifier)) {
      fail(category::k_invalid_function_call);
      return Null{};
    }
    namespace_path.push_back(std::move(name));
    name = make_identifier(cur());
    advance();
  }

  if (!check(TokenKind::LParen, expect::k_lparen)) {
    fail(category::k_invalid_function_call);
    return Null{};
  }
  advance();

  NewlineScope scope(*this, true);
  FuncCall call{FuncName(std::move(namespace_path), std::move(name)), {}, false};

  while (!failed()) {
    if (check(TokenKind::RParen, expect::k_rparen)) {
      advance();
      break;
    }

    call.args.push_back(parse_expr());
    if (failed()) {
      break;
    }

    if (check(TokenKind::Comma, expect::k_comma)) {
      advance();
      continue;
    }
    if (check(TokenKind::Ellipsis, expect::k_ellipsis)) {
      advance();
      call.expand_final = true;
      if (!check(TokenKind::RParen, expect::k_rparen)) {
        fail(category::k_invalid_function_call);
        break;
      }
      advance();
      break;
    }
    if (check(TokenKind::RParen, expect::k_rparen)) {
      advance();
      break;
    }
    fail(category::k_invalid_function_call);
  }

  return Box<FuncCall>(std::move(call));
}

// ============================================================================
// Collections
// ============================================================================

Expression Parser::parse_tuple()
{
  advance();  // `[`
  NewlineScope scope(*this, true);

  if (at_keyword(k_for) && cur(1).kind == TokenKind::Identifier) {
    return parse_for_expr(false);
  }

  Array array;
  while (!failed()) {
    if (check(TokenKind::RBracket, expect::k_rbracket)) {
      advance();
      break;
    }

    array.elements.push_back(parse_expr());
    if (failed()) {
      break;
    }

    if (check(TokenKind::Comma, expect::k_comma)) {
      advance();
      continue;
    }
    if (check(TokenKind::RBracket, expect::k_rbracket)) {
      advance();
      break;
    }
    fail(category::k_invalid_array_item);
  }

  return Box<Array>(std::move(array));
}

Expression Parser::parse_object()
{
  advance();  // `{`
  NewlineScope scope(*this, false);

  while (at(TokenKind::Newline)) {
    advance();
  }
  if (at_keyword(k_for)) {
    NewlineScope peek(*this, true);
    if (cur(1).kind == TokenKind::Identifier) {
      return parse_for_expr(true);
    }
  }

  Object object;
  while (!failed()) {
    while (at(TokenKind::Newline)) {
      advance();
    }
    if (check(TokenKind::RBrace, expect::k_rbrace)) {
      advance();
      break;
    }

    auto key = parse_object_key();
    if (!key) {
      break;
    }
    if (!check(TokenKind::Eq, expect::k_eq) && !check(TokenKind::Colon, expect::k_colon)) {
      fail(category::k_invalid_object_item);
      break;
    }
    advance();

    Expression value = parse_expr();
    if (failed()) {
      break;
    }
    object.items.push_back(ObjectItem{std::move(*key), std::move(value)});

    if (check(TokenKind::RBrace, expect::k_rbrace)) {
      advance();
      break;
    }
    if (check(TokenKind::Comma, expect::k_comma) || check(TokenKind::Newline, expect::k_newline)) {
      advance();
      continue;
    }
    fail(category::k_invalid_object_item);
  }

  return Box<Object>(std::move(object));
}

std::optional<ObjectKey> Parser::parse_object_key()
{
  // A bare identifier directly followed by the separator is an identifier key;
  // anything else is an expression key.
  if (at(TokenKind::Identifier)) {
    const TokenKind next = cur(1).kind;
    if (next == TokenKind::Eq || next == TokenKind::Colon) {
      Identifier key = make_identifier(cur());
      advance();
      return ObjectKey(std::move(key));
    }
  }

  Expression key = parse_expr();
  if (failed()) {
    return std::nullopt;
  }
  return ObjectKey(std::in_place_type<Expression>, std::move(key));
}

Expression Parser::parse_parenthesis()
{
  advance();  // `(`
  NewlineScope scope(*this, true);

  Expression inner = parse_expr();
  if (!check(TokenKind::RParen, expect::k_rparen)) {
    fail(category::k_invalid_parenthesis);
    return inner;
  }
  advance();
  return Box<Parenthesis>(Parenthesis{std::move(inner)});
}

// ============================================================================
// For expressions
// ============================================================================

Expression Parser::parse_for_expr(bool object)
{
  NewlineScope scope(*this, true);
  advance();  // `for`

  Identifier first = make_identifier(cur());
  advance();

  std::optional<Identifier> key_var;
  Identifier value_var = first;
  if (check(TokenKind::Comma, expect::k_comma)) {
    advance();
    if (!check(TokenKind::Identifier, expect::k_identifier)) {
      fail(category::k_invalid_for_expression);
      return Null{};
    }
    key_var = std::move(first);
    value_var = make_identifier(cur());
    advance();
  }

  if (!check_keyword(k_in, expect::k_in)) {
    fail(category::k_invalid_for_expression);
    return Null{};
  }
  advance();

  Expression collection = parse_expr();
  if (!check(TokenKind::Colon, expect::k_colon)) {
    fail(category::k_invalid_for_expression);
    return Null{};
  }
  advance();

  std::optional<Expression> key_expr;
  if (object) {
    Expression key = parse_expr();
    if (!check(TokenKind::FatArrow, expect::k_fat_arrow)) {
      fail(category::k_invalid_for_expression);
      return Null{};
    }
    advance();
    key_expr = std::move(key);
  }

  Expression value = parse_expr();

  bool grouping = false;
  if (object && check(TokenKind::Ellipsis, expect::k_ellipsis)) {
    advance();
    grouping = true;
  }

  std::optional<Expression> cond;
  if (check_keyword(k_if, expect::k_if)) {
    advance();
    cond = parse_expr();
  }

  const bool closed = object ? check(TokenKind::RBrace, expect::k_rbrace)
                             : check(TokenKind::RBracket, expect::k_rbracket);
  if (!closed) {
    fail(category::k_invalid_for_expression);
    return Null{};
  }
  advance();

  return Box<ForExpr>(ForExpr{
    std::move(key_var), std::move(value_var), std::move(collection), std::move(key_expr),
    std::move(value), grouping, std::move(cond)});
}

}  // namespace hcl::syntax
