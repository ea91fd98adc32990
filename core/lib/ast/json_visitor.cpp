// hcl/ast/json_visitor.cpp - JSON serialization implementation
//
#include "hcl/ast/json_visitor.hpp"

#include <string>
#include <variant>

#include "hcl/ast/ast_enums.hpp"

namespace hcl
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_identifier(const Identifier & id)
{
  return json{{"type", "Identifier"}, {"name", id.as_str()}};
}

json j_strip(const StripMarkers & s) { return json{{"left", s.left}, {"right", s.right}}; }

json j_optional_identifier(const std::optional<Identifier> & id)
{
  return id ? json(id->as_str()) : json(nullptr);
}

json j_optional_expr(const std::optional<Expression> & e)
{
  return e ? to_json(*e) : json(nullptr);
}

json j_number(const Number & n)
{
  json j{{"type", "Number"}, {"text", n.to_string()}};
  switch (n.kind()) {
    case Number::Kind::PosInt:
      j["value"] = *n.as_u64();
      break;
    case Number::Kind::NegInt:
      j["value"] = *n.as_i64();
      break;
    case Number::Kind::Float:
      j["value"] = n.as_f64();
      break;
  }
  return j;
}

std::string func_name_string(const FuncName & name)
{
  std::string out;
  for (const auto & ns : name.namespace_path) {
    out += ns.as_str();
    out += "::";
  }
  out += name.name.as_str();
  return out;
}

// ============================================================================
// Template serialization
// ============================================================================

struct TemplateElementToJson
{
  json operator()(const std::string & literal) const
  {
    return json{{"type", "Literal"}, {"value", literal}};
  }

  json operator()(const Interpolation & interp) const
  {
    return json{
      {"type", "Interpolation"}, {"expr", to_json(interp.expr)}, {"strip", j_strip(interp.strip)}};
  }

  json operator()(const Box<IfDirective> & dir) const
  {
    return json{
      {"type", "IfDirective"},
      {"cond", to_json(dir->cond)},
      {"trueTemplate", to_json(dir->true_template)},
      {"falseTemplate", dir->false_template ? to_json(*dir->false_template) : json(nullptr)},
      {"ifStrip", j_strip(dir->if_strip)},
      {"elseStrip", j_strip(dir->else_strip)},
      {"endifStrip", j_strip(dir->endif_strip)}};
  }

  json operator()(const Box<ForDirective> & dir) const
  {
    return json{
      {"type", "ForDirective"},
      {"keyVar", j_optional_identifier(dir->key_var)},
      {"valueVar", dir->value_var.as_str()},
      {"collection", to_json(dir->collection)},
      {"body", to_json(dir->body)},
      {"forStrip", j_strip(dir->for_strip)},
      {"endforStrip", j_strip(dir->endfor_strip)}};
  }
};

// ============================================================================
// Traversal serialization
// ============================================================================

struct TraversalOperatorToJson
{
  json operator()(const GetAttr & op) const
  {
    return json{{"type", "GetAttr"}, {"name", op.name.as_str()}};
  }
  json operator()(const Index & op) const
  {
    return json{{"type", "Index"}, {"expr", to_json(op.expr)}};
  }
  json operator()(const LegacyIndex & op) const
  {
    return json{{"type", "LegacyIndex"}, {"index", op.index}};
  }
  json operator()(const AttrSplat &) const { return json{{"type", "AttrSplat"}}; }
  json operator()(const FullSplat &) const { return json{{"type", "FullSplat"}}; }
};

// ============================================================================
// Expression serialization
// ============================================================================

struct ExprToJson
{
  json operator()(const Null &) const { return json{{"type", "Null"}}; }
  json operator()(bool b) const { return json{{"type", "Bool"}, {"value", b}}; }
  json operator()(const Number & n) const { return j_number(n); }
  json operator()(const std::string & s) const { return json{{"type", "String"}, {"value", s}}; }
  json operator()(const Variable & v) const
  {
    return json{{"type", "Variable"}, {"name", v.name.as_str()}};
  }

  json operator()(const Box<Array> & arr) const
  {
    json elements = json::array();
    for (const auto & e : arr->elements) {
      elements.push_back(to_json(e));
    }
    return json{{"type", "Array"}, {"elements", std::move(elements)}};
  }

  json operator()(const Box<Object> & obj) const
  {
    json items = json::array();
    for (const auto & item : obj->items) {
      json key = std::holds_alternative<Identifier>(item.key)
                   ? j_identifier(std::get<Identifier>(item.key))
                   : to_json(std::get<Expression>(item.key));
      items.push_back(json{{"key", std::move(key)}, {"value", to_json(item.value)}});
    }
    return json{{"type", "Object"}, {"items", std::move(items)}};
  }

  json operator()(const Box<TemplateExpr> & t) const
  {
    return json{{"type", "TemplateExpr"}, {"template", to_json(t->tmpl)}};
  }

  json operator()(const Box<Heredoc> & h) const
  {
    return json{
      {"type", "Heredoc"},
      {"delimiter", h->delimiter.as_str()},
      {"strip", h->strip == HeredocStrip::Indent ? "indent" : "none"},
      {"template", to_json(h->tmpl)}};
  }

  json operator()(const Box<FuncCall> & call) const
  {
    json args = json::array();
    for (const auto & a : call->args) {
      args.push_back(to_json(a));
    }
    return json{
      {"type", "FuncCall"},
      {"name", func_name_string(call->name)},
      {"args", std::move(args)},
      {"expandFinal", call->expand_final}};
  }

  json operator()(const Box<Traversal> & t) const
  {
    json ops = json::array();
    for (const auto & op : t->operators) {
      ops.push_back(std::visit(TraversalOperatorToJson{}, op));
    }
    return json{{"type", "Traversal"}, {"expr", to_json(t->expr)}, {"operators", std::move(ops)}};
  }

  json operator()(const Box<UnaryExpr> & u) const
  {
    return json{
      {"type", "UnaryExpr"}, {"op", std::string(to_string(u->op))}, {"expr", to_json(u->expr)}};
  }

  json operator()(const Box<BinaryExpr> & b) const
  {
    return json{
      {"type", "BinaryExpr"},
      {"op", std::string(to_string(b->op))},
      {"lhs", to_json(b->lhs)},
      {"rhs", to_json(b->rhs)}};
  }

  json operator()(const Box<Conditional> & c) const
  {
    return json{
      {"type", "Conditional"},
      {"cond", to_json(c->cond)},
      {"trueExpr", to_json(c->true_expr)},
      {"falseExpr", to_json(c->false_expr)}};
  }

  json operator()(const Box<Parenthesis> & p) const
  {
    return json{{"type", "Parenthesis"}, {"inner", to_json(p->inner)}};
  }

  json operator()(const Box<ForExpr> & f) const
  {
    return json{
      {"type", "ForExpr"},
      {"keyVar", j_optional_identifier(f->key_var)},
      {"valueVar", f->value_var.as_str()},
      {"collection", to_json(f->collection_expr)},
      {"keyExpr", j_optional_expr(f->key_expr)},
      {"valueExpr", to_json(f->value_expr)},
      {"grouping", f->grouping},
      {"cond", j_optional_expr(f->cond_expr)}};
  }
};

// ============================================================================
// Structure serialization
// ============================================================================

json j_label(const BlockLabel & label)
{
  return json{{"type", label.is_identifier() ? "Identifier" : "String"}, {"value", label.as_str()}};
}

struct StructureToJson
{
  json operator()(const Attribute & attr) const
  {
    return json{{"type", "Attribute"}, {"key", attr.key.as_str()}, {"value", to_json(attr.value)}};
  }

  json operator()(const Block & block) const
  {
    json labels = json::array();
    for (const auto & l : block.labels) {
      labels.push_back(j_label(l));
    }
    return json{
      {"type", "Block"},
      {"identifier", block.identifier.as_str()},
      {"labels", std::move(labels)},
      {"body", to_json(block.body)}};
  }
};

}  // namespace

json to_json(const Body & body)
{
  json structures = json::array();
  for (const auto & s : body) {
    structures.push_back(to_json(s));
  }
  return json{{"type", "Body"}, {"structures", std::move(structures)}};
}

json to_json(const Structure & structure) { return std::visit(StructureToJson{}, structure); }

json to_json(const Expression & expr) { return std::visit(ExprToJson{}, expr); }

json to_json(const Template & tmpl)
{
  json elements = json::array();
  for (const auto & e : tmpl.elements) {
    elements.push_back(std::visit(TemplateElementToJson{}, e));
  }
  return json{{"type", "Template"}, {"elements", std::move(elements)}};
}

}  // namespace hcl
