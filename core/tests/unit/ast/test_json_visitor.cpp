// test_json_visitor.cpp - Unit tests for model JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "hcl/ast/json_visitor.hpp"
#include "hcl/test_support/parse_helpers.hpp"

using nlohmann::json;

namespace hcl
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source)
  {
    return to_json(test_support::parse_body_ok(source));
  }

  static json expr_json(const std::string & source)
  {
    return to_json(test_support::parse_expression_ok(source));
  }
};

TEST_F(JsonVisitorTest, EmptyBody)
{
  auto j = parse_and_serialize("");
  EXPECT_EQ(j["type"], "Body");
  EXPECT_TRUE(j["structures"].is_array());
  EXPECT_EQ(j["structures"].size(), 0);
}

TEST_F(JsonVisitorTest, Attribute)
{
  auto j = parse_and_serialize("count = 3\n");
  ASSERT_EQ(j["structures"].size(), 1);

  auto attr = j["structures"][0];
  EXPECT_EQ(attr["type"], "Attribute");
  EXPECT_EQ(attr["key"], "count");
  EXPECT_EQ(attr["value"]["type"], "Number");
  EXPECT_EQ(attr["value"]["text"], "3");
  EXPECT_EQ(attr["value"]["value"], 3);
}

TEST_F(JsonVisitorTest, BlockWithLabels)
{
  auto j = parse_and_serialize("resource \"aws_instance\" web {\n  ami = \"x\"\n}\n");
  auto block = j["structures"][0];
  EXPECT_EQ(block["type"], "Block");
  EXPECT_EQ(block["identifier"], "resource");
  ASSERT_EQ(block["labels"].size(), 2);
  EXPECT_EQ(block["labels"][0]["type"], "String");
  EXPECT_EQ(block["labels"][0]["value"], "aws_instance");
  EXPECT_EQ(block["labels"][1]["type"], "Identifier");
  EXPECT_EQ(block["body"]["type"], "Body");
  EXPECT_EQ(block["body"]["structures"][0]["value"]["type"], "String");
}

TEST_F(JsonVisitorTest, Numbers)
{
  EXPECT_EQ(expr_json("-5")["value"], -5);
  EXPECT_EQ(expr_json("1.5")["value"], 1.5);
  EXPECT_EQ(expr_json("1.5")["text"], "1.5");
}

TEST_F(JsonVisitorTest, Literals)
{
  EXPECT_EQ(expr_json("null")["type"], "Null");
  EXPECT_EQ(expr_json("true")["value"], true);
  EXPECT_EQ(expr_json("x")["type"], "Variable");
  EXPECT_EQ(expr_json("x")["name"], "x");
}

TEST_F(JsonVisitorTest, Operators)
{
  auto j = expr_json("!a || b");
  EXPECT_EQ(j["type"], "BinaryExpr");
  EXPECT_EQ(j["op"], "||");
  EXPECT_EQ(j["lhs"]["type"], "UnaryExpr");
  EXPECT_EQ(j["lhs"]["op"], "!");

  auto c = expr_json("a ? b : c");
  EXPECT_EQ(c["type"], "Conditional");
  EXPECT_EQ(c["falseExpr"]["name"], "c");
}

TEST_F(JsonVisitorTest, ObjectKeys)
{
  auto j = expr_json("{ a = 1, \"b\" = 2 }");
  EXPECT_EQ(j["type"], "Object");
  ASSERT_EQ(j["items"].size(), 2);
  EXPECT_EQ(j["items"][0]["key"]["type"], "Identifier");
  EXPECT_EQ(j["items"][0]["key"]["name"], "a");
  EXPECT_EQ(j["items"][1]["key"]["type"], "String");
}

TEST_F(JsonVisitorTest, TraversalAndCall)
{
  auto j = expr_json("p::f(xs...).a[0].1.*[*]");
  EXPECT_EQ(j["type"], "Traversal");
  EXPECT_EQ(j["expr"]["type"], "FuncCall");
  EXPECT_EQ(j["expr"]["name"], "p::f");
  EXPECT_EQ(j["expr"]["expandFinal"], true);

  const auto & ops = j["operators"];
  ASSERT_EQ(ops.size(), 5);
  EXPECT_EQ(ops[0]["type"], "GetAttr");
  EXPECT_EQ(ops[1]["type"], "Index");
  EXPECT_EQ(ops[2]["type"], "LegacyIndex");
  EXPECT_EQ(ops[2]["index"], 1);
  EXPECT_EQ(ops[3]["type"], "AttrSplat");
  EXPECT_EQ(ops[4]["type"], "FullSplat");
}

TEST_F(JsonVisitorTest, ForExpression)
{
  auto j = expr_json("{ for k, v in m : k => v... if v }");
  EXPECT_EQ(j["type"], "ForExpr");
  EXPECT_EQ(j["keyVar"], "k");
  EXPECT_EQ(j["valueVar"], "v");
  EXPECT_EQ(j["grouping"], true);
  EXPECT_EQ(j["cond"]["type"], "Variable");

  auto list = expr_json("[for v in l : v]");
  EXPECT_TRUE(list["keyVar"].is_null());
  EXPECT_TRUE(list["keyExpr"].is_null());
  EXPECT_TRUE(list["cond"].is_null());
}

TEST_F(JsonVisitorTest, Templates)
{
  auto j = expr_json("\"a ${~b} %{ if c }d%{ endif }\"");
  EXPECT_EQ(j["type"], "TemplateExpr");
  const auto & elements = j["template"]["elements"];
  ASSERT_EQ(elements.size(), 4);
  EXPECT_EQ(elements[0]["type"], "Literal");
  EXPECT_EQ(elements[1]["type"], "Interpolation");
  EXPECT_EQ(elements[1]["strip"]["left"], true);
  EXPECT_EQ(elements[1]["strip"]["right"], false);
  EXPECT_EQ(elements[3]["type"], "IfDirective");
  EXPECT_TRUE(elements[3]["falseTemplate"].is_null());
}

TEST_F(JsonVisitorTest, Heredoc)
{
  auto j = expr_json("<<-EOT\n  x\n  EOT");
  EXPECT_EQ(j["type"], "Heredoc");
  EXPECT_EQ(j["delimiter"], "EOT");
  EXPECT_EQ(j["strip"], "indent");
  EXPECT_EQ(j["template"]["elements"][0]["value"], "x\n");
}

}  // namespace hcl
