// hcl/ast/expr.hpp - Expression and template model
//
// Expressions are a closed std::variant with one alternative per grammar
// production. Recursive alternatives are held through Box<T>, which owns its
// value exclusively and deep-copies on copy, so every node has exactly one
// parent and all types keep value semantics.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "hcl/ast/ast_enums.hpp"
#include "hcl/ast/identifier.hpp"
#include "hcl/ast/number.hpp"

namespace hcl
{

// ============================================================================
// Utility Types
// ============================================================================

/**
 * Wrapper for recursive types in std::variant.
 * Provides pointer semantics with value-like construction.
 */
template <typename T>
class Box
{
public:
  Box() : ptr_(std::make_unique<T>()) {}
  Box(T value) : ptr_(std::make_unique<T>(std::move(value))) {}
  Box(const Box & other) : ptr_(std::make_unique<T>(*other.ptr_)) {}
  Box(Box &&) noexcept = default;

  Box & operator=(const Box & other)
  {
    if (this != &other) {
      ptr_ = std::make_unique<T>(*other.ptr_);
    }
    return *this;
  }
  Box & operator=(Box &&) noexcept = default;

  T & operator*() { return *ptr_; }
  const T & operator*() const { return *ptr_; }
  T * operator->() { return ptr_.get(); }
  const T * operator->() const { return ptr_.get(); }
  T * get() { return ptr_.get(); }
  [[nodiscard]] const T * get() const { return ptr_.get(); }

  friend bool operator==(const Box & a, const Box & b) { return *a.ptr_ == *b.ptr_; }

private:
  std::unique_ptr<T> ptr_;
};

// ============================================================================
// Leaf Expressions
// ============================================================================

/// The `null` literal.
struct Null
{
  bool operator==(const Null &) const = default;
};

/// A bare variable reference.
struct Variable
{
  Identifier name;

  bool operator==(const Variable &) const = default;
};

// ============================================================================
// Expression
// ============================================================================

struct Array;
struct Object;
struct TemplateExpr;
struct Heredoc;
struct FuncCall;
struct Traversal;
struct UnaryExpr;
struct BinaryExpr;
struct Conditional;
struct Parenthesis;
struct ForExpr;
struct IfDirective;
struct ForDirective;

/**
 * Any expression. `std::string` is a plain string literal; quoted strings with
 * interpolations or directives are TemplateExpr.
 */
using Expression = std::variant<
  Null, bool, Number, std::string, Variable, Box<Array>, Box<Object>, Box<TemplateExpr>,
  Box<Heredoc>, Box<FuncCall>, Box<Traversal>, Box<UnaryExpr>, Box<BinaryExpr>, Box<Conditional>,
  Box<Parenthesis>, Box<ForExpr>>;

// ============================================================================
// Templates
// ============================================================================

/// `~` markers on the left (`${~`) and right (`~}`) delimiter of a template
/// sequence. They are recorded, not applied.
struct StripMarkers
{
  bool left = false;
  bool right = false;

  bool operator==(const StripMarkers &) const = default;
};

/// `${ expr }`
struct Interpolation
{
  Expression expr;
  StripMarkers strip;

  bool operator==(const Interpolation & other) const;
};

/// Literal text, interpolation, or directive.
using TemplateElement =
  std::variant<std::string, Interpolation, Box<IfDirective>, Box<ForDirective>>;

/**
 * A parsed template: the content of a quoted string, a heredoc or a template
 * file. Literal text is stored unescaped and adjacent literals are merged by
 * the parser.
 */
struct Template
{
  std::vector<TemplateElement> elements;

  bool operator==(const Template & other) const;
};

/// `%{ if cond }...%{ else }...%{ endif }`
struct IfDirective
{
  Expression cond;
  Template true_template;
  std::optional<Template> false_template;
  StripMarkers if_strip;
  StripMarkers else_strip;
  StripMarkers endif_strip;

  bool operator==(const IfDirective & other) const;
};

/// `%{ for key, value in collection }...%{ endfor }`
struct ForDirective
{
  std::optional<Identifier> key_var;
  Identifier value_var;
  Expression collection;
  Template body;
  StripMarkers for_strip;
  StripMarkers endfor_strip;

  bool operator==(const ForDirective & other) const;
};

// ============================================================================
// Collections
// ============================================================================

struct Array
{
  std::vector<Expression> elements;

  bool operator==(const Array & other) const;
};

/// Object keys are either bare identifiers or arbitrary expressions
/// (quoted strings, parenthesized expressions, ...).
using ObjectKey = std::variant<Identifier, Expression>;

struct ObjectItem
{
  ObjectKey key;
  Expression value;

  bool operator==(const ObjectItem & other) const;
};

/// Ordered key/value pairs. Repeated keys are kept.
struct Object
{
  std::vector<ObjectItem> items;

  bool operator==(const Object & other) const;
};

// ============================================================================
// Strings
// ============================================================================

/// A quoted string that contains interpolations or directives.
struct TemplateExpr
{
  Template tmpl;

  bool operator==(const TemplateExpr & other) const;
};

/// `<<MARKER` / `<<-MARKER` heredoc.
struct Heredoc
{
  Identifier delimiter;
  Template tmpl;
  HeredocStrip strip = HeredocStrip::None;

  bool operator==(const Heredoc & other) const;
};

// ============================================================================
// Function Calls
// ============================================================================

/// Optionally namespaced function name (`provider::ns::name`).
struct FuncName
{
  std::vector<Identifier> namespace_path;
  Identifier name;

  explicit FuncName(Identifier n) : name(std::move(n)) {}
  FuncName(std::vector<Identifier> ns, Identifier n)
  : namespace_path(std::move(ns)), name(std::move(n))
  {
  }

  [[nodiscard]] bool is_namespaced() const noexcept { return !namespace_path.empty(); }

  bool operator==(const FuncName &) const = default;
};

/// `name(args...)`; `expand_final` marks a trailing `...` on the last argument.
struct FuncCall
{
  FuncName name;
  std::vector<Expression> args;
  bool expand_final = false;

  bool operator==(const FuncCall & other) const;
};

// ============================================================================
// Traversals
// ============================================================================

/// `.name`
struct GetAttr
{
  Identifier name;

  bool operator==(const GetAttr &) const = default;
};

/// `[expr]`
struct Index
{
  Expression expr;

  bool operator==(const Index & other) const;
};

/// `.0`
struct LegacyIndex
{
  uint64_t index = 0;

  bool operator==(const LegacyIndex &) const = default;
};

/// `.*`
struct AttrSplat
{
  bool operator==(const AttrSplat &) const = default;
};

/// `[*]`
struct FullSplat
{
  bool operator==(const FullSplat &) const = default;
};

using TraversalOperator = std::variant<GetAttr, Index, LegacyIndex, AttrSplat, FullSplat>;

/// A base expression followed by one or more traversal operators.
struct Traversal
{
  Expression expr;
  std::vector<TraversalOperator> operators;

  bool operator==(const Traversal & other) const;
};

// ============================================================================
// Operations
// ============================================================================

struct UnaryExpr
{
  UnaryOperator op;
  Expression expr;

  bool operator==(const UnaryExpr & other) const;
};

/// Operands must already respect operator precedence; use Parenthesis to
/// group a lower-precedence operand.
struct BinaryExpr
{
  Expression lhs;
  BinaryOperator op;
  Expression rhs;

  bool operator==(const BinaryExpr & other) const;
};

/// `cond ? true_expr : false_expr`
struct Conditional
{
  Expression cond;
  Expression true_expr;
  Expression false_expr;

  bool operator==(const Conditional & other) const;
};

/// `( inner )`
struct Parenthesis
{
  Expression inner;

  bool operator==(const Parenthesis & other) const;
};

/**
 * `[for k, v in coll : value if cond]` or
 * `{for k, v in coll : key => value... if cond}`.
 *
 * key_expr is present exactly for the object form.
 */
struct ForExpr
{
  std::optional<Identifier> key_var;
  Identifier value_var;
  Expression collection_expr;
  std::optional<Expression> key_expr;
  Expression value_expr;
  bool grouping = false;
  std::optional<Expression> cond_expr;

  bool operator==(const ForExpr & other) const;
};

}  // namespace hcl
