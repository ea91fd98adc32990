// Canonical rendering of model nodes.
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "hcl/ast/builder.hpp"
#include "hcl/format/formatter.hpp"
#include "hcl/test_support/parse_helpers.hpp"

using namespace hcl;
using hcl::test_support::parse_expression_ok;
using hcl::test_support::parse_template_ok;
using hcl::test_support::reformat;

namespace
{

Expression str(const char * s) { return std::string(s); }

Expression array(std::vector<Expression> elements)
{
  return Box<Array>(Array{std::move(elements)});
}

Expression object(std::vector<ObjectItem> items) { return Box<Object>(Object{std::move(items)}); }

ObjectItem item(const char * key, Expression value)
{
  return ObjectItem{ObjectKey(Identifier(key)), std::move(value)};
}

}  // namespace

// ============================================================================
// Structures
// ============================================================================

TEST(Formatter, SingleAttribute)
{
  const Body body = BodyBuilder().add_attribute(Identifier("_foo"), str("bar")).build();
  EXPECT_EQ(to_string(body), "_foo = \"bar\"\n");
}

TEST(Formatter, EmptyBody) { EXPECT_EQ(to_string(Body{}), ""); }

TEST(Formatter, BlocksAreSeparatedByBlankLines)
{
  const Body body = BodyBuilder()
                      .add_attribute(Identifier("a"), Number(1))
                      .add_attribute(Identifier("b"), Number(2))
                      .add_block(BlockBuilder(Identifier("c"))
                                   .add_attribute(Identifier("d"), true)
                                   .add_block(BlockBuilder(Identifier("e")).build())
                                   .build())
                      .add_block(BlockBuilder(Identifier("f")).build())
                      .add_attribute(Identifier("g"), Null{})
                      .build();

  EXPECT_EQ(
    to_string(body),
    "a = 1\n"
    "b = 2\n"
    "\n"
    "c {\n"
    "  d = true\n"
    "\n"
    "  e {}\n"
    "}\n"
    "\n"
    "f {}\n"
    "\n"
    "g = null\n");
}

TEST(Formatter, DenseOmitsBlankLines)
{
  FormatterOptions options;
  options.dense = true;
  EXPECT_EQ(reformat("a = 1\n\nb {}\nc {}\n", options), "a = 1\nb {}\nc {}\n");
}

TEST(Formatter, IndentWidth)
{
  FormatterOptions options;
  options.indent_width = 4;
  EXPECT_EQ(
    reformat("a {\nb {\nc = 1\n}\n}\n", options), "a {\n    b {\n        c = 1\n    }\n}\n");
}

TEST(Formatter, BlockLabels)
{
  const Block block = BlockBuilder(Identifier("resource"))
                        .add_label(BlockLabel(std::string("aws \"x\"")))
                        .add_label(BlockLabel(Identifier("web")))
                        .build();
  EXPECT_EQ(to_string(block), "resource \"aws \\\"x\\\"\" web {}\n");
}

TEST(Formatter, OneLineBlockIsExpanded)
{
  EXPECT_EQ(reformat("a { b = 1 }\n"), "a {\n  b = 1\n}\n");
}

TEST(Formatter, StructureOverload)
{
  const Structure s = Attribute{Identifier("x"), Number(1)};
  EXPECT_EQ(to_string(s), "x = 1\n");
}

// ============================================================================
// Collections
// ============================================================================

TEST(Formatter, CallArgumentsAreCompact)
{
  const FuncCall call = FuncCallBuilder(FuncName(Identifier("func")))
                          .arg(array({Number(1), Number(2), Number(3)}))
                          .arg(object({item("foo", str("bar")), item("baz", str("qux"))}))
                          .build();
  EXPECT_EQ(
    to_string(Expression(Box<FuncCall>(call))),
    "func([1, 2, 3], { foo = \"bar\", baz = \"qux\" })");
}

TEST(Formatter, StringObjectKeyStaysQuoted)
{
  const Expression key = str("bar");
  const Expression call = Box<FuncCall>(
    FuncCallBuilder(FuncName(Identifier("foo")))
      .arg(object({ObjectItem{ObjectKey(std::in_place_type<Expression>, key),
                              Box<FuncCall>(FuncCall{FuncName(Identifier("baz")), {}, false})}}))
      .build());
  EXPECT_EQ(to_string(call), "foo({ \"bar\" = baz() })");
}

TEST(Formatter, AttributeObjectIsExpanded)
{
  EXPECT_EQ(
    reformat("x = { a = 1, b = [1, 2], c = { d = true } }\n"),
    "x = {\n"
    "  a = 1\n"
    "  b = [1, 2]\n"
    "  c = {\n"
    "    d = true\n"
    "  }\n"
    "}\n");
}

TEST(Formatter, ObjectInsideArrayIsCompact)
{
  EXPECT_EQ(reformat("x = [{ a = 1 }, {}]\n"), "x = [{ a = 1 }, {}]\n");
}

TEST(Formatter, ExpandedArrays)
{
  FormatterOptions options;
  options.compact_arrays = false;
  EXPECT_EQ(
    reformat("x = [1, { a = 1 }]\n", options),
    "x = [\n"
    "  1,\n"
    "  {\n"
    "    a = 1\n"
    "  },\n"
    "]\n");
}

TEST(Formatter, CompactObjects)
{
  FormatterOptions options;
  options.compact_objects = true;
  EXPECT_EQ(reformat("x = {\n  a = 1\n  b = 2\n}\n", options), "x = { a = 1, b = 2 }\n");
}

TEST(Formatter, EmptyCollections)
{
  EXPECT_EQ(reformat("a = []\nb = {}\n"), "a = []\nb = {}\n");
}

TEST(Formatter, PreferIdentKeys)
{
  FormatterOptions options;
  options.compact_objects = true;
  options.prefer_ident_keys = true;
  EXPECT_EQ(
    reformat("x = { \"a\" = 1, \"not valid\" = 2, (k) = 3 }\n", options),
    "x = { a = 1, \"not valid\" = 2, (k) = 3 }\n");
}

TEST(Formatter, TopLevelExpressionHasNoTrailingNewline)
{
  EXPECT_EQ(to_string(parse_expression_ok("{ a = 1 }")), "{\n  a = 1\n}");
  EXPECT_EQ(to_string(parse_expression_ok("[1,2]")), "[1, 2]");
}

// ============================================================================
// Operators and traversals
// ============================================================================

TEST(Formatter, OperatorsAreSpaced)
{
  EXPECT_EQ(to_string(parse_expression_ok("a+b*c")), "a + b * c");
  EXPECT_EQ(to_string(parse_expression_ok("(a+b)*c")), "(a + b) * c");
  EXPECT_EQ(to_string(parse_expression_ok("!a&&-b")), "!a && -b");
  EXPECT_EQ(to_string(parse_expression_ok("a?b:c")), "a ? b : c");
  EXPECT_EQ(to_string(parse_expression_ok("x>=1||y!=2")), "x >= 1 || y != 2");
}

TEST(Formatter, Numbers)
{
  EXPECT_EQ(to_string(Expression(Number(-5))), "-5");
  EXPECT_EQ(to_string(Expression(*Number::from_f64(1.0))), "1.0");
  EXPECT_EQ(to_string(Expression(*Number::from_f64(0.25))), "0.25");
  EXPECT_EQ(to_string(Expression(*Number::from_f64(1e20))), "1e+20");
}

TEST(Formatter, Traversals)
{
  EXPECT_EQ(to_string(parse_expression_ok("a . b [ 0 ] .1 .* [ * ]")), "a.b[0].1.*[*]");
  EXPECT_EQ(to_string(parse_expression_ok("f()[\"k\"]")), "f()[\"k\"]");
}

TEST(Formatter, LegacyIndexOnNumberBase)
{
  EXPECT_EQ(reformat("x = 1 .0\n"), "x = 1 .0\n");
  EXPECT_EQ(reformat("x = 1.5 .0\n"), "x = 1.5.0\n");

  const Body body = test_support::parse_body_ok("x = 1 .0\n");
  EXPECT_EQ(test_support::parse_body_ok(to_string(body)), body);
}

TEST(Formatter, FunctionCalls)
{
  EXPECT_EQ(to_string(parse_expression_ok("f( a , b ... )")), "f(a, b...)");
  EXPECT_EQ(to_string(parse_expression_ok("p::ns::f()")), "p::ns::f()");
}

TEST(Formatter, ForExpressions)
{
  EXPECT_EQ(
    to_string(parse_expression_ok("[ for k,v in m: v if v!=null ]")),
    "[for k, v in m : v if v != null]");
  EXPECT_EQ(
    to_string(parse_expression_ok("{for v in l : v.id => v ...}")), "{for v in l : v.id => v...}");
}

// ============================================================================
// Strings and templates
// ============================================================================

TEST(Formatter, QuotedStringEscapes)
{
  EXPECT_EQ(
    to_string(str("q\" b\\ n\n t\t ${x} %{y} \x01")),
    "\"q\\\" b\\\\ n\\n t\\t $${x} %%{y} \\u0001\"");
}

TEST(Formatter, DollarWithoutBraceIsNotEscaped)
{
  EXPECT_EQ(to_string(str("$5 and 100%")), "\"$5 and 100%\"");
}

TEST(Formatter, QuotedTemplate)
{
  EXPECT_EQ(to_string(parse_expression_ok("\"hi ${ name }!\"")), "\"hi ${name}!\"");
  EXPECT_EQ(
    to_string(parse_expression_ok("\"%{if a}x%{else}y%{endif}\"")),
    "\"%{ if a }x%{ else }y%{ endif }\"");
  EXPECT_EQ(
    to_string(parse_expression_ok("\"%{~for k,v in m~}${~k~}%{~endfor~}\"")),
    "\"%{~ for k, v in m ~}${~k~}%{~ endfor ~}\"");
}

TEST(Formatter, Heredoc)
{
  EXPECT_EQ(reformat("doc = <<EOT\nhello\n  world\nEOT\n"), "doc = <<EOT\nhello\n  world\nEOT\n");
  EXPECT_EQ(reformat("doc = <<-EOT\n    a\n    EOT\n"), "doc = <<-EOT\na\nEOT\n");
}

TEST(Formatter, HeredocWithoutFinalNewline)
{
  const Heredoc heredoc{Identifier("END"), Template{{std::string("text")}}, HeredocStrip::None};
  EXPECT_EQ(to_string(Expression(Box<Heredoc>(heredoc))), "<<END\ntext\nEND");
}

TEST(Formatter, HeredocInsideCompactObject)
{
  FormatterOptions options;
  options.compact_objects = true;
  EXPECT_EQ(
    reformat("x = {\n  a = <<EOT\nhi\nEOT\n  b = 1\n}\n", options),
    "x = { a = <<EOT\nhi\nEOT\nb = 1 }\n");
}

TEST(Formatter, BareTemplate)
{
  const Template tmpl = parse_template_ok("a $${b} ${c} %{ for x in y }${x}\\n%{ endfor }");
  EXPECT_EQ(to_string(tmpl), "a $${b} ${c} %{ for x in y }${x}\\n%{ endfor }");
}

// ============================================================================
// Entry points
// ============================================================================

TEST(Formatter, FormatMatchesToString)
{
  const Body body = test_support::parse_body_ok("a = [1, 2]\nb { c = \"d\" }\n");
  const auto formatted = format(body);
  ASSERT_TRUE(formatted.has_value());
  EXPECT_EQ(*formatted, to_string(body));
}

TEST(Formatter, FormatToStream)
{
  std::ostringstream os;
  const auto result = format_to(os, Expression(Number(7)));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(os.str(), "7");
}

TEST(Formatter, FormatToFailingStream)
{
  std::ostringstream os;
  os.setstate(std::ios::badbit);
  const auto result = format_to(os, BodyBuilder().add_attribute(Identifier("a"), true).build());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().message, "failed to write to output stream");
}

TEST(Formatter, WriterAppendsToStream)
{
  std::ostringstream os;
  Formatter formatter(os);
  formatter.write(Attribute{Identifier("a"), Number(1)});
  formatter.write(BlockBuilder(Identifier("b")).build());
  EXPECT_EQ(os.str(), "a = 1\nb {}\n");
}
