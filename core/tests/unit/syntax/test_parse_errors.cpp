// Rendered diagnostics for malformed input.
//
#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "hcl/basic/diagnostic_printer.hpp"
#include "hcl/syntax/frontend.hpp"
#include "hcl/test_support/parse_helpers.hpp"

using hcl::ParseError;
using hcl::ParserOptions;
using hcl::test_support::parse_body_error;
using hcl::test_support::parse_expression_error;

// ============================================================================
// Structures
// ============================================================================

TEST(ParseErrors, InvalidStructureOnSecondLine)
{
  const ParseError err = parse_body_error("foo = 1\nbar [");
  EXPECT_EQ(err.line(), 2u);
  EXPECT_EQ(err.column(), 5u);
  EXPECT_EQ(err.offset(), 12u);
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 2, column 5\n"
    "  |\n"
    "2 | bar [\n"
    "  |     ^---\n"
    "  |\n"
    "  = invalid structure; expected `{`, `=`, `\"` or identifier");
}

TEST(ParseErrors, UnclosedBlockAtEndOfInput)
{
  const ParseError err = parse_body_error("ident {");
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 1, column 8\n"
    "  |\n"
    "1 | ident {\n"
    "  |        ^---\n"
    "  |\n"
    "  = invalid block body; expected `}`, newline or identifier");
}

TEST(ParseErrors, UnclosedLabeledBlock)
{
  const ParseError err = parse_body_error("ident \"label\" {");
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 1, column 16\n"
    "  |\n"
    "1 | ident \"label\" {\n"
    "  |                ^---\n"
    "  |\n"
    "  = invalid block body; expected `}`, newline or identifier");
}

TEST(ParseErrors, OneLineBlockWithoutAssignment)
{
  const ParseError err = parse_body_error("ident { foo }");
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 1, column 13\n"
    "  |\n"
    "1 | ident { foo }\n"
    "  |             ^---\n"
    "  |\n"
    "  = invalid attribute; expected `=`");
}

TEST(ParseErrors, BlockBodyStartingWithBracket)
{
  const ParseError err = parse_body_error("ident { [ }");
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 1, column 9\n"
    "  |\n"
    "1 | ident { [ }\n"
    "  |         ^---\n"
    "  |\n"
    "  = invalid block body; expected `}`, newline or identifier");
}

TEST(ParseErrors, UnclosedMultiLineBlock)
{
  const ParseError err = parse_body_error("a {\n  b = 1\n");
  EXPECT_EQ(err.line(), 3u);
  EXPECT_EQ(err.column(), 1u);
  EXPECT_EQ(err.cause(), "invalid block body; expected `}`, newline or identifier");
}

TEST(ParseErrors, AttributeFollowedByGarbage)
{
  const ParseError err = parse_body_error("a = 1 b = 2\n");
  EXPECT_EQ(err.column(), 7u);
  EXPECT_EQ(err.category(), "invalid attribute");
}

// ============================================================================
// Expressions
// ============================================================================

TEST(ParseErrors, SingleQuotesAreNotStrings)
{
  const ParseError err = parse_body_error("ident = ''");
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 1, column 9\n"
    "  |\n"
    "1 | ident = ''\n"
    "  |         ^---\n"
    "  |\n"
    "  = invalid expression; expected `\"`, `[`, `{`, `-`, `!`, `(`, `_`, `<`, letter or digit");
}

TEST(ParseErrors, InvalidTraversalOperator)
{
  const ParseError err = parse_body_error("ident = var.%");
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 1, column 13\n"
    "  |\n"
    "1 | ident = var.%\n"
    "  |             ^---\n"
    "  |\n"
    "  = invalid traversal operator; expected `*`, identifier or unsigned integer");
}

TEST(ParseErrors, InvalidObjectItemSeparator)
{
  const ParseError err = parse_body_error("ident = { foo = \"\"\" }");
  EXPECT_EQ(
    err.message(),
    " --> HCL parse error in line 1, column 19\n"
    "  |\n"
    "1 | ident = { foo = \"\"\" }\n"
    "  |                   ^---\n"
    "  |\n"
    "  = invalid object item; expected `}`, `,` or newline");
}

TEST(ParseErrors, LegacyIndexMustBeUnsignedInteger)
{
  const ParseError err = parse_expression_error("a.1e3");
  EXPECT_EQ(err.category(), "invalid traversal operator");
  EXPECT_EQ(err.column(), 3u);
}

TEST(ParseErrors, TrailingInputAfterExpression)
{
  const ParseError err = parse_expression_error("1 2");
  EXPECT_EQ(err.column(), 3u);
  EXPECT_EQ(err.cause(), "invalid expression; expected end of input");
}

TEST(ParseErrors, MissingConditionalColon)
{
  const ParseError err = parse_expression_error("a ? b");
  EXPECT_EQ(err.category(), "invalid conditional");
  EXPECT_EQ(err.column(), 6u);
}

TEST(ParseErrors, UnclosedFunctionCall)
{
  const ParseError err = parse_expression_error("f(a b)");
  EXPECT_EQ(err.column(), 5u);
  EXPECT_EQ(err.cause(), "invalid function call; expected `,`, `...` or `)`");
}

TEST(ParseErrors, ForExpressionWithoutIn)
{
  const ParseError err = parse_expression_error("[for x of xs : x]");
  EXPECT_EQ(err.category(), "invalid for expression");
  EXPECT_EQ(err.column(), 8u);
}

TEST(ParseErrors, EmptyInputIsNotAnExpression)
{
  const ParseError err = parse_expression_error("");
  EXPECT_EQ(err.category(), "invalid expression");
  EXPECT_EQ(err.line(), 1u);
  EXPECT_EQ(err.column(), 1u);
}

// ============================================================================
// Strings and templates
// ============================================================================

TEST(ParseErrors, UnterminatedString)
{
  const ParseError err = parse_body_error("a = \"abc");
  EXPECT_EQ(err.column(), 9u);
  EXPECT_EQ(err.cause(), "invalid string; expected `\"`");
}

TEST(ParseErrors, StringBrokenByLineEnd)
{
  const ParseError err = parse_body_error("a = \"abc\nb = 1\n");
  EXPECT_EQ(err.line(), 1u);
  EXPECT_EQ(err.column(), 9u);
  EXPECT_EQ(err.category(), "invalid string");
}

TEST(ParseErrors, UnknownEscapeSequence)
{
  const ParseError err = parse_body_error(R"(a = "\q")");
  EXPECT_EQ(err.column(), 7u);
  EXPECT_EQ(
    err.cause(), "invalid escape sequence; expected `\\`, `\"`, `n`, `r`, `t`, `u` or `U`");
}

TEST(ParseErrors, UnicodeEscapeWithBadHexDigit)
{
  const ParseError err = parse_body_error(R"(a = "\u12G4")");
  EXPECT_EQ(err.column(), 10u);
  EXPECT_EQ(err.cause(), "invalid unicode escape; expected hexadecimal digit");
}

TEST(ParseErrors, UnicodeEscapeForSurrogate)
{
  const ParseError err = parse_body_error(R"(a = "\uD800")");
  EXPECT_EQ(err.column(), 6u);
  EXPECT_EQ(err.cause(), "invalid unicode escape");
}

TEST(ParseErrors, UnknownTemplateDirective)
{
  const auto result = hcl::parse_template("x %{ bogus } y");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().column(), 6u);
  EXPECT_EQ(result.error().cause(), "invalid template directive; expected `if` or `for`");
}

TEST(ParseErrors, StrayEndifInTemplate)
{
  const auto result = hcl::parse_template("a%{ endif }");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().column(), 2u);
  EXPECT_EQ(result.error().cause(), "invalid template; expected end of input");
}

TEST(ParseErrors, UnclosedIfDirective)
{
  const auto result = hcl::parse_template("%{ if a }b");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().column(), 11u);
  EXPECT_EQ(result.error().cause(), "invalid template directive; expected `%{`");
}

TEST(ParseErrors, UnterminatedHeredoc)
{
  const ParseError err = parse_body_error("a = <<EOT\nhello\n");
  EXPECT_EQ(err.line(), 3u);
  EXPECT_EQ(err.cause(), "invalid heredoc; expected heredoc end marker");
}

// ============================================================================
// Nesting limit
// ============================================================================

TEST(ParseErrors, NestingDepthIsBounded)
{
  ParserOptions options;
  options.max_nesting_depth = 8;

  std::string src = "a = ";
  src += std::string(20, '[');
  src += std::string(20, ']');

  const ParseError err = parse_body_error(src, options);
  EXPECT_EQ(err.category(), "expression nesting exceeds maximum depth of 8");
  EXPECT_TRUE(err.expected().empty());
}

TEST(ParseErrors, DeepNestingWithinLimitParses)
{
  std::string src = "a = ";
  src += std::string(20, '[');
  src += std::string(20, ']');
  EXPECT_TRUE(hcl::parse_body(src).has_value());
}

TEST(ParseErrors, NestedBlocksCountTowardsDepth)
{
  ParserOptions options;
  options.max_nesting_depth = 2;
  const ParseError err = parse_body_error("a {\n  b {\n    c {}\n  }\n}\n", options);
  EXPECT_EQ(err.line(), 3u);
}

TEST(ParseErrors, DeeplyNestedBlocksFailWithoutThrowing)
{
  std::string src;
  for (int i = 0; i < 200; ++i) {
    src += "a {\n";
  }

  const auto result = hcl::parse_body(src);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().category(), "expression nesting exceeds maximum depth of 128");
  EXPECT_EQ(result.error().line(), 129u);
  EXPECT_EQ(result.error().column(), 1u);
}

// ============================================================================
// Furthest progress
// ============================================================================

TEST(ParseErrors, FailureInsideObjectKeyWinsOverEarlierAttempts)
{
  // `}` is tried at the key's first token, the key itself fails further on
  const ParseError err = parse_body_error("x = { (a + ) = 1 }");
  EXPECT_EQ(err.offset(), 11u);
  EXPECT_EQ(err.column(), 12u);
  EXPECT_EQ(
    err.cause(),
    "invalid expression; expected `\"`, `[`, `{`, `-`, `!`, `(`, `_`, `<`, letter or digit");
  EXPECT_EQ(err.cause().find("`}`"), std::string::npos);
}

TEST(ParseErrors, ReportedOffsetIsNeverBeforeConsumedInput)
{
  for (const char * src : {"a = [1, 2, (3 4)]", "a = f(x, { k = }) ", "b { c = d.e.% }"}) {
    SCOPED_TRACE(src);
    const ParseError err = parse_body_error(src);
    const std::string_view text(src);
    EXPECT_GE(err.offset(), text.find_last_of("(.{") + 1);
  }
}

// ============================================================================
// Determinism
// ============================================================================

TEST(ParseErrors, RepeatedParsesRenderIdentically)
{
  for (const char * src :
       {"foo = 1\nbar [", "ident { foo }", "ident = var.%", "a = \"\\q\"", "a = <<EOT\nx\n"}) {
    SCOPED_TRACE(src);
    const ParseError first = parse_body_error(src);
    const ParseError second = parse_body_error(src);
    EXPECT_EQ(first.message(), second.message());
    EXPECT_EQ(first, second);

    hcl::syntax::Parser parser(src);
    const auto again = parser.parse_body();
    const auto once_more = parser.parse_body();
    ASSERT_FALSE(again.has_value());
    ASSERT_FALSE(once_more.has_value());
    EXPECT_EQ(again.error().message(), first.message());
    EXPECT_EQ(once_more.error().message(), first.message());
  }
}

// ============================================================================
// Rendering
// ============================================================================

TEST(ParseErrors, RenderUsesSuppliedSource)
{
  const std::string src = "x = 1\ny = )\n";
  const ParseError err = parse_body_error(src);
  EXPECT_EQ(hcl::render(err, src), hcl::render(err));
  EXPECT_EQ(err.source_line(), "y = )");
}

TEST(ParseErrors, GutterWidensWithLineNumber)
{
  std::string src;
  for (int i = 0; i < 11; ++i) {
    src += "a = 1\n";
  }
  src += "b = ]\n";

  const ParseError err = parse_body_error(src);
  EXPECT_EQ(err.line(), 12u);
  EXPECT_EQ(
    err.message(),
    "  --> HCL parse error in line 12, column 5\n"
    "   |\n"
    "12 | b = ]\n"
    "   |     ^---\n"
    "   |\n"
    "   = invalid expression; expected `\"`, `[`, `{`, `-`, `!`, `(`, `_`, `<`, letter or digit");
}
