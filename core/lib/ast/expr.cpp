// hcl/ast/expr.cpp - Structural equality for recursive expression nodes
//
#include "hcl/ast/expr.hpp"

namespace hcl
{

bool Interpolation::operator==(const Interpolation & other) const
{
  return expr == other.expr && strip == other.strip;
}

bool Template::operator==(const Template & other) const { return elements == other.elements; }

bool IfDirective::operator==(const IfDirective & other) const
{
  return cond == other.cond && true_template == other.true_template &&
         false_template == other.false_template && if_strip == other.if_strip &&
         else_strip == other.else_strip && endif_strip == other.endif_strip;
}

bool ForDirective::operator==(const ForDirective & other) const
{
  return key_var == other.key_var && value_var == other.value_var &&
         collection == other.collection && body == other.body && for_strip == other.for_strip &&
         endfor_strip == other.endfor_strip;
}

bool Array::operator==(const Array & other) const { return elements == other.elements; }

bool ObjectItem::operator==(const ObjectItem & other) const
{
  return key == other.key && value == other.value;
}

bool Object::operator==(const Object & other) const { return items == other.items; }

bool TemplateExpr::operator==(const TemplateExpr & other) const { return tmpl == other.tmpl; }

bool Heredoc::operator==(const Heredoc & other) const
{
  return delimiter == other.delimiter && tmpl == other.tmpl && strip == other.strip;
}

bool FuncCall::operator==(const FuncCall & other) const
{
  return name == other.name && args == other.args && expand_final == other.expand_final;
}

bool Index::operator==(const Index & other) const { return expr == other.expr; }

bool Traversal::operator==(const Traversal & other) const
{
  return expr == other.expr && operators == other.operators;
}

bool UnaryExpr::operator==(const UnaryExpr & other) const
{
  return op == other.op && expr == other.expr;
}

bool BinaryExpr::operator==(const BinaryExpr & other) const
{
  return lhs == other.lhs && op == other.op && rhs == other.rhs;
}

bool Conditional::operator==(const Conditional & other) const
{
  return cond == other.cond && true_expr == other.true_expr && false_expr == other.false_expr;
}

bool Parenthesis::operator==(const Parenthesis & other) const { return inner == other.inner; }

bool ForExpr::operator==(const ForExpr & other) const
{
  return key_var == other.key_var && value_var == other.value_var &&
         collection_expr == other.collection_expr && key_expr == other.key_expr &&
         value_expr == other.value_expr && grouping == other.grouping &&
         cond_expr == other.cond_expr;
}

}  // namespace hcl
