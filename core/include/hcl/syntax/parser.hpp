#pragma once

#include <cstdint>
#include <deque>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "hcl/ast/expr.hpp"
#include "hcl/ast/structure.hpp"
#include "hcl/basic/diagnostic.hpp"
#include "hcl/basic/source_manager.hpp"
#include "hcl/syntax/lexer.hpp"
#include "hcl/syntax/token.hpp"

namespace hcl
{

struct ParserOptions
{
  /// Maximum nesting of expressions, blocks and template directives.
  /// Deeper input fails with a ParseError instead of exhausting the stack.
  uint32_t max_nesting_depth = 128;
};

}  // namespace hcl

namespace hcl::syntax
{

/**
 * Recursive-descent parser.
 *
 * Alternatives are chosen by peeking at most two tokens ahead; nothing is
 * ever re-parsed. Every check at the current token records what it would
 * have accepted, so a failure reports the full set of alternatives at the
 * furthest position reached. The first failure is final: afterwards the
 * token stream reads as end of input and all productions unwind.
 */
class Parser
{
public:
  explicit Parser(std::string_view src, ParserOptions options = {});

  [[nodiscard]] std::expected<Body, ParseError> parse_body();
  [[nodiscard]] std::expected<Expression, ParseError> parse_expression();
  [[nodiscard]] std::expected<Template, ParseError> parse_template();

private:
  enum class TemplateContext : uint8_t {
    Quoted,   // backslash escapes are processed
    Heredoc,  // literal text, only $${ and %%{ are escapes
    Bare,     // template file, same escaping as heredocs
  };

  class NewlineScope;
  class DepthGuard;

  void reset(LexerStart start);

  // Token helpers
  [[nodiscard]] const Token & token_at(size_t index);
  [[nodiscard]] size_t cur_index(size_t lookahead);
  [[nodiscard]] const Token & cur(size_t lookahead = 0);
  [[nodiscard]] bool at(TokenKind k);
  [[nodiscard]] bool at_keyword(std::string_view kw);
  void advance();

  // Checks that record what was expected at the current token
  [[nodiscard]] bool check(TokenKind k, Expected what);
  [[nodiscard]] bool check_keyword(std::string_view kw, Expected what);
  void record(uint32_t offset, Expected what);

  // Failure reporting
  void fail(std::string_view category, const std::vector<Expected> & extra = {});
  void fail_at(
    uint32_t offset, std::string_view category, const std::vector<Expected> & extra = {});
  void fail_nesting();
  [[nodiscard]] bool failed() const noexcept { return error_.has_value(); }

  // Structures (parser.cpp)
  [[nodiscard]] Body parse_body_items(bool in_block);
  [[nodiscard]] std::optional<Structure> parse_structure();
  [[nodiscard]] Body parse_block_body();
  [[nodiscard]] std::optional<BlockLabel> parse_string_label();
  void expect_structure_end(std::string_view category);

  // Expressions (parse_expr.cpp)
  [[nodiscard]] Expression parse_expr();
  [[nodiscard]] Expression parse_binary(int min_precedence);
  [[nodiscard]] Expression parse_unary();
  [[nodiscard]] Expression parse_postfix(Expression base);
  [[nodiscard]] Expression parse_primary();
  [[nodiscard]] Expression parse_number();
  [[nodiscard]] Expression parse_identifier_expr();
  [[nodiscard]] Expression parse_func_call();
  [[nodiscard]] Expression parse_tuple();
  [[nodiscard]] Expression parse_object();
  [[nodiscard]] std::optional<ObjectKey> parse_object_key();
  [[nodiscard]] Expression parse_parenthesis();
  [[nodiscard]] Expression parse_for_expr(bool object);
  [[nodiscard]] std::optional<BinaryOperator> peek_binary_operator();

  // Templates (parse_template.cpp)
  [[nodiscard]] Expression parse_quoted_string();
  [[nodiscard]] Expression parse_heredoc();
  [[nodiscard]] Template parse_template_elements(TemplateContext ctx);
  [[nodiscard]] std::optional<Interpolation> parse_interpolation();
  [[nodiscard]] std::optional<IfDirective> parse_if_directive(TemplateContext ctx);
  [[nodiscard]] std::optional<ForDirective> parse_for_directive(TemplateContext ctx);
  [[nodiscard]] bool at_directive(std::string_view kw);
  [[nodiscard]] std::optional<bool> parse_directive_open(std::string_view kw, Expected what);
  [[nodiscard]] std::optional<bool> parse_directive_close();
  [[nodiscard]] std::optional<std::string> unescape_literal(const Token & tok, TemplateContext ctx);

  [[nodiscard]] static Identifier make_identifier(const Token & tok);

  std::string_view src_;
  ParserOptions options_;
  SourceFile source_;
  Lexer lexer_;

  // Tokens pulled from the lexer so far (comments removed). A deque keeps
  // references stable while more tokens are pulled.
  std::deque<Token> tokens_;
  size_t pos_ = 0;
  bool ignore_newlines_ = false;
  uint32_t depth_ = 0;

  // Alternatives recorded at expected_offset_
  std::vector<Expected> expected_;
  uint32_t expected_offset_ = UINT32_MAX;

  std::optional<ParseError> error_;
  Token eof_token_;
};

}  // namespace hcl::syntax
