// hcl/syntax/parser.cpp - Token stream, failure reporting and structures
//
#include "hcl/syntax/parser.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

#include "hcl/syntax/expected.hpp"
#include "parser_scopes.hpp"

namespace hcl::syntax
{

// ============================================================================
// Entry points
// ============================================================================

Parser::Parser(std::string_view src, ParserOptions options)
: src_(src), options_(options), source_(src), lexer_(src)
{
  const auto end = static_cast<uint32_t>(src_.size());
  eof_token_ = Token{TokenKind::Eof, SourceRange(end, end), {}};
}

void Parser::reset(LexerStart start)
{
  lexer_ = Lexer(src_, start);
  tokens_.clear();
  pos_ = 0;
  ignore_newlines_ = false;
  depth_ = 0;
  expected_.clear();
  expected_offset_ = UINT32_MAX;
  error_.reset();
}

std::expected<Body, ParseError> Parser::parse_body()
{
  reset(LexerStart::Expression);
  Body body = parse_body_items(false);
  if (error_) {
    return std::unexpected(*error_);
  }
  return body;
}

std::expected<Expression, ParseError> Parser::parse_expression()
{
  reset(LexerStart::Expression);
  NewlineScope scope(*this, true);
  Expression expr = parse_expr();
  if (!failed() && !check(TokenKind::Eof, expect::k_end_of_input)) {
    fail(category::k_invalid_expression);
  }
  if (error_) {
    return std::unexpected(*error_);
  }
  return expr;
}

std::expected<Template, ParseError> Parser::parse_template()
{
  reset(LexerStart::Template);
  Template tmpl = parse_template_elements(TemplateContext::Bare);
  if (!failed() && !check(TokenKind::Eof, expect::k_end_of_input)) {
    fail(category::k_invalid_template);
  }
  if (error_) {
    return std::unexpected(*error_);
  }
  return tmpl;
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::token_at(size_t index)
{
  while (tokens_.size() <= index) {
    if (!tokens_.empty() && tokens_.back().kind == TokenKind::Eof) {
      return tokens_.back();
    }
    Token t = lexer_.next_token();
    if (t.kind == TokenKind::LineComment || t.kind == TokenKind::BlockComment) {
      continue;
    }
    tokens_.push_back(t);
  }
  return tokens_[index];
}

size_t Parser::cur_index(size_t lookahead)
{
  size_t i = pos_;
  while (true) {
    const Token & t = token_at(i);
    if (t.kind == TokenKind::Eof) {
      return tokens_.size() - 1;
    }
    if (ignore_newlines_ && t.kind == TokenKind::Newline) {
      ++i;
      continue;
    }
    if (lookahead == 0) {
      return i;
    }
    --lookahead;
    ++i;
  }
}

const Token & Parser::cur(size_t lookahead)
{
  if (error_) {
    return eof_token_;
  }
  return tokens_[cur_index(lookahead)];
}

bool Parser::at(TokenKind k) { return cur().kind == k; }

bool Parser::at_keyword(std::string_view kw)
{
  const Token & t = cur();
  return t.kind == TokenKind::Identifier && t.text == kw;
}

void Parser::advance()
{
  if (error_) {
    return;
  }
  const size_t i = cur_index(0);
  if (tokens_[i].kind != TokenKind::Eof) {
    pos_ = i + 1;
  }
}

bool Parser::check(TokenKind k, Expected what)
{
  const Token & t = cur();
  record(t.begin(), what);
  return t.kind == k;
}

bool Parser::check_keyword(std::string_view kw, Expected what)
{
  const Token & t = cur();
  record(t.begin(), what);
  return t.kind == TokenKind::Identifier && t.text == kw;
}

void Parser::record(uint32_t offset, Expected what)
{
  if (error_) {
    return;
  }
  if (offset != expected_offset_) {
    expected_.clear();
    expected_offset_ = offset;
  }
  if (std::find(expected_.begin(), expected_.end(), what) == expected_.end()) {
    expected_.push_back(what);
  }
}

// ============================================================================
// Failure reporting
// ============================================================================

void Parser::fail(std::string_view category, const std::vector<Expected> & extra)
{
  if (error_) {
    return;
  }
  const uint32_t offset = cur().begin();

  std::vector<Expected> expected;
  if (offset == expected_offset_) {
    expected = expected_;
  }
  expected.insert(expected.end(), extra.begin(), extra.end());

  const LineColumn lc = source_.line_column(offset);
  error_.emplace(
    std::string(category), std::move(expected), offset, lc.line, lc.column,
    std::string(source_.get_line(lc.line - 1)));
}

void Parser::fail_at(
  uint32_t offset, std::string_view category, const std::vector<Expected> & extra)
{
  if (error_) {
    return;
  }
  const LineColumn lc = source_.line_column(offset);
  error_.emplace(
    std::string(category), extra, offset, lc.line, lc.column,
    std::string(source_.get_line(lc.line - 1)));
}

void Parser::fail_nesting()
{
  if (error_) {
    return;
  }
  fail_at(
    cur().begin(),
    fmt::format(fmt::runtime(category::k_nesting_too_deep), options_.max_nesting_depth));
}

Identifier Parser::make_identifier(const Token & tok) { return Identifier(tok.text); }

// ============================================================================
// Structures
// ============================================================================

Body Parser::parse_body_items(bool in_block)
{
  NewlineScope scope(*this, false);
  Body body;

  while (!failed()) {
    while (check(TokenKind::Newline, expect::k_newline)) {
      advance();
    }

    if (in_block) {
      if (check(TokenKind::RBrace, expect::k_rbrace)) {
        break;
      }
    } else if (at(TokenKind::Eof)) {
      break;
    }

    if (!check(TokenKind::Identifier, expect::k_identifier)) {
      fail(in_block ? category::k_invalid_block_body : category::k_invalid_structure);
      break;
    }

    if (auto structure = parse_structure()) {
      body.push_back(std::move(*structure));
    }
  }

  return body;
}

std::optional<Structure> Parser::parse_structure()
{
  DepthGuard guard(*this);
  if (failed()) {
    return std::nullopt;
  }
  Identifier ident = make_identifier(cur());
  advance();

  std::vector<BlockLabel> labels;
  while (!failed()) {
    if (check(TokenKind::LBrace, expect::k_lbrace)) {
      advance();
      Body body = parse_block_body();
      expect_structure_end(category::k_invalid_block);
      if (failed()) {
        return std::nullopt;
      }
      return Block{std::move(ident), std::move(labels), std::move(body)};
    }

    if (labels.empty() && check(TokenKind::Eq, expect::k_eq)) {
      advance();
      Expression value = parse_expr();
      expect_structure_end(category::k_invalid_attribute);
      if (failed()) {
        return std::nullopt;
      }
      return Attribute{std::move(ident), std::move(value)};
    }

    if (check(TokenKind::OQuote, expect::k_quote)) {
      if (auto label = parse_string_label()) {
        labels.push_back(std::move(*label));
      }
      continue;
    }

    if (check(TokenKind::Identifier, expect::k_identifier)) {
      labels.emplace_back(make_identifier(cur()));
      advance();
      continue;
    }

    fail(category::k_invalid_structure);
  }

  return std::nullopt;
}

Body Parser::parse_block_body()
{
  NewlineScope scope(*this, false);

  // `{}`
  if (check(TokenKind::RBrace, expect::k_rbrace)) {
    advance();
    return {};
  }

  // Multi-line body closed by `}` on its own line
  if (check(TokenKind::Newline, expect::k_newline)) {
    Body body = parse_body_items(true);
    advance();  // `}`
    return body;
  }

  // One-line block: `{ key = value }`
  if (check(TokenKind::Identifier, expect::k_identifier)) {
    Identifier key = make_identifier(cur());
    advance();
    if (!check(TokenKind::Eq, expect::k_eq)) {
      fail(category::k_invalid_attribute);
      return {};
    }
    advance();
    Expression value = parse_expr();
    if (!check(TokenKind::RBrace, expect::k_rbrace)) {
      fail(category::k_invalid_block);
      return {};
    }
    advance();

    Body body;
    body.push_back(Attribute{std::move(key), std::move(value)});
    return body;
  }

  fail(category::k_invalid_block_body);
  return {};
}

std::optional<BlockLabel> Parser::parse_string_label()
{
  advance();  // opening quote
  NewlineScope scope(*this, false);

  std::string label;
  while (at(TokenKind::TemplateLiteral)) {
    auto text = unescape_literal(cur(), TemplateContext::Quoted);
    if (!text) {
      return std::nullopt;
    }
    label += *text;
    advance();
  }

  if (!check(TokenKind::CQuote, expect::k_quote)) {
    fail(category::k_invalid_block_label);
    return std::nullopt;
  }
  advance();
  return BlockLabel(std::move(label));
}

void Parser::expect_structure_end(std::string_view category)
{
  if (check(TokenKind::Newline, expect::k_newline)) {
    advance();
    return;
  }
  if (at(TokenKind::Eof)) {
    return;
  }
  fail(category);
}

}  // namespace hcl::syntax
