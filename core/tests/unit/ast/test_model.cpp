// Value semantics of the document model.
//
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <variant>

#include "hcl/ast/ast_enums.hpp"
#include "hcl/ast/expr.hpp"
#include "hcl/ast/structure.hpp"

using namespace hcl;

// ============================================================================
// Box
// ============================================================================

TEST(AstModel, BoxCopiesDeeply)
{
  Box<Array> original(Array{{Number(1), Number(2)}});
  Box<Array> copy = original;
  copy->elements.push_back(Number(3));

  EXPECT_EQ(original->elements.size(), 2u);
  EXPECT_EQ(copy->elements.size(), 3u);
  EXPECT_NE(original.get(), copy.get());
}

TEST(AstModel, BoxEqualityComparesValues)
{
  const Box<Parenthesis> a(Parenthesis{Number(1)});
  const Box<Parenthesis> b(Parenthesis{Number(1)});
  const Box<Parenthesis> c(Parenthesis{Number(2)});
  EXPECT_EQ(a, b);
  EXPECT_FALSE(a == c);
}

TEST(AstModel, ExpressionsCopyIndependently)
{
  Expression original = Box<Object>(Object{{ObjectItem{Identifier("k"), Number(1)}}});
  Expression copy = original;
  std::get<Box<Object>>(copy)->items[0].value = Number(2);

  EXPECT_NE(original, copy);
  EXPECT_EQ(std::get<Box<Object>>(original)->items[0].value, Expression(Number(1)));
}

// ============================================================================
// Equality
// ============================================================================

TEST(AstModel, StructuralEquality)
{
  const auto make = [](const char * op_name) {
    return Expression(Box<Traversal>(Traversal{
      Variable{Identifier("a")}, {GetAttr{Identifier(op_name)}, Index{Number(0)}, FullSplat{}}}));
  };
  EXPECT_EQ(make("b"), make("b"));
  EXPECT_NE(make("b"), make("c"));
}

TEST(AstModel, StringAndTemplateAreDistinct)
{
  const Expression plain = std::string("x");
  const Expression tmpl = Box<TemplateExpr>(TemplateExpr{Template{{std::string("x")}}});
  EXPECT_NE(plain, tmpl);
}

TEST(AstModel, StripMarkersTakePartInEquality)
{
  const Interpolation a{Variable{Identifier("x")}, {false, false}};
  const Interpolation b{Variable{Identifier("x")}, {true, false}};
  EXPECT_FALSE(a == b);
}

// ============================================================================
// Structures
// ============================================================================

TEST(AstModel, BlockLabelKinds)
{
  const BlockLabel ident(Identifier("web"));
  const BlockLabel str(std::string("has space"));
  EXPECT_TRUE(ident.is_identifier());
  EXPECT_TRUE(str.is_string());
  EXPECT_EQ(str.as_str(), "has space");

  // Same text, different kinds
  EXPECT_NE(BlockLabel(Identifier("x")), BlockLabel(std::string("x")));
  EXPECT_EQ(BlockLabel(Identifier("x")).into_string(), "x");
}

TEST(AstModel, BodyAccessors)
{
  Body body;
  EXPECT_TRUE(body.empty());
  body.push_back(Attribute{Identifier("a"), Number(1)});
  body.push_back(Block{Identifier("b"), {}, Body{}});
  body.push_back(Attribute{Identifier("c"), Null{}});

  EXPECT_EQ(body.size(), 3u);
  EXPECT_EQ(body.structures().size(), 3u);
  ASSERT_EQ(body.attributes().size(), 2u);
  EXPECT_EQ(body.attributes()[1]->key.as_str(), "c");
  ASSERT_EQ(body.blocks().size(), 1u);
  EXPECT_EQ(body.blocks()[0]->identifier.as_str(), "b");

  size_t count = 0;
  for (const auto & structure : body) {
    (void)structure;
    ++count;
  }
  EXPECT_EQ(count, 3u);

  const auto inner = std::move(body).into_inner();
  EXPECT_EQ(inner.size(), 3u);
}

TEST(AstModel, BodyOrderMatters)
{
  const Body ab(std::vector<Structure>{
    Attribute{Identifier("a"), Number(1)}, Attribute{Identifier("b"), Number(2)}});
  const Body ba(std::vector<Structure>{
    Attribute{Identifier("b"), Number(2)}, Attribute{Identifier("a"), Number(1)}});
  EXPECT_FALSE(ab == ba);
}

// ============================================================================
// Operators
// ============================================================================

TEST(AstModel, OperatorText)
{
  EXPECT_EQ(to_string(BinaryOperator::NotEq), "!=");
  EXPECT_EQ(to_string(BinaryOperator::Mod), "%");
  EXPECT_EQ(to_string(UnaryOperator::Not), "!");
}

TEST(AstModel, OperatorPrecedence)
{
  EXPECT_LT(precedence(BinaryOperator::Or), precedence(BinaryOperator::And));
  EXPECT_LT(precedence(BinaryOperator::And), precedence(BinaryOperator::Eq));
  EXPECT_LT(precedence(BinaryOperator::Eq), precedence(BinaryOperator::Less));
  EXPECT_LT(precedence(BinaryOperator::Less), precedence(BinaryOperator::Plus));
  EXPECT_LT(precedence(BinaryOperator::Plus), precedence(BinaryOperator::Mul));
  EXPECT_EQ(precedence(BinaryOperator::Div), precedence(BinaryOperator::Mod));
  static_assert(precedence(BinaryOperator::Minus) == precedence(BinaryOperator::Plus));
}
