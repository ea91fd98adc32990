// hcl/format/formatter.cpp - Canonical text rendering of the model
//
#include "hcl/format/formatter.hpp"

#include <fmt/format.h>

#include <sstream>
#include <type_traits>
#include <variant>

namespace hcl
{

namespace
{

template <typename>
inline constexpr bool k_always_false = false;

[[nodiscard]] bool ends_with_newline(const Template & tmpl)
{
  if (tmpl.elements.empty()) {
    return true;
  }
  const auto * text = std::get_if<std::string>(&tmpl.elements.back());
  return text != nullptr && text->ends_with('\n');
}

}  // namespace

/// Increases the indentation level for the lifetime of the scope.
class Formatter::IndentScope
{
public:
  explicit IndentScope(Formatter & f) : f_(f) { ++f_.level_; }
  ~IndentScope() { --f_.level_; }

  IndentScope(const IndentScope &) = delete;
  IndentScope & operator=(const IndentScope &) = delete;

private:
  Formatter & f_;
};

// ============================================================================
// Output primitives
// ============================================================================

void Formatter::emit(std::string_view text)
{
  if (pending_newline_) {
    os_ << '\n';
    pending_newline_ = false;
  }
  os_ << text;
}

void Formatter::newline()
{
  os_ << '\n';
  pending_newline_ = false;
}

void Formatter::indent() { emit(std::string(level_ * options_.indent_width, ' ')); }

// ============================================================================
// Structures
// ============================================================================

void Formatter::write(const Body & body) { write_body(body); }

void Formatter::write(const Structure & structure)
{
  if (const auto * attr = std::get_if<Attribute>(&structure)) {
    write_attribute(*attr);
  } else {
    write_block(std::get<Block>(structure));
  }
}

void Formatter::write(const Attribute & attr) { write_attribute(attr); }

void Formatter::write(const Block & block) { write_block(block); }

void Formatter::write_body(const Body & body)
{
  bool first = true;
  bool prev_block = false;
  for (const auto & structure : body) {
    const bool is_block = std::holds_alternative<Block>(structure);
    if (!first && !options_.dense && (is_block || prev_block)) {
      newline();
    }
    write(structure);
    first = false;
    prev_block = is_block;
  }
}

void Formatter::write_attribute(const Attribute & attr)
{
  indent();
  emit(attr.key.as_str());
  emit(" = ");
  write_expr(attr.value, Context::Expanded);
  newline();
}

void Formatter::write_block(const Block & block)
{
  indent();
  emit(block.identifier.as_str());
  for (const auto & label : block.labels) {
    emit(" ");
    if (label.is_identifier()) {
      emit(label.as_str());
    } else {
      write_quoted_string(label.as_str());
    }
  }

  if (block.body.empty()) {
    emit(" {}");
    newline();
    return;
  }

  emit(" {");
  newline();
  {
    const IndentScope scope(*this);
    write_body(block.body);
  }
  indent();
  emit("}");
  newline();
}

// ============================================================================
// Expressions
// ============================================================================

void Formatter::write(const Expression & expr) { write_expr(expr, Context::Expanded); }

void Formatter::write_expr(const Expression & expr, Context ctx)
{
  std::visit(
    [&](const auto & node) {
      using T = std::decay_t<decltype(node)>;
      if constexpr (std::is_same_v<T, Null>) {
        emit("null");
      } else if constexpr (std::is_same_v<T, bool>) {
        emit(node ? "true" : "false");
      } else if constexpr (std::is_same_v<T, Number>) {
        emit(node.to_string());
      } else if constexpr (std::is_same_v<T, std::string>) {
        write_quoted_string(node);
      } else if constexpr (std::is_same_v<T, Variable>) {
        emit(node.name.as_str());
      } else if constexpr (std::is_same_v<T, Box<Array>>) {
        write_array(*node, ctx);
      } else if constexpr (std::is_same_v<T, Box<Object>>) {
        write_object(*node, ctx);
      } else if constexpr (std::is_same_v<T, Box<TemplateExpr>>) {
        emit("\"");
        write_template(node->tmpl, true);
        emit("\"");
      } else if constexpr (std::is_same_v<T, Box<Heredoc>>) {
        write_heredoc(*node);
      } else if constexpr (std::is_same_v<T, Box<FuncCall>>) {
        write_func_call(*node);
      } else if constexpr (std::is_same_v<T, Box<Traversal>>) {
        write_traversal(*node);
      } else if constexpr (std::is_same_v<T, Box<UnaryExpr>>) {
        emit(to_string(node->op));
        write_expr(node->expr, Context::Compact);
      } else if constexpr (std::is_same_v<T, Box<BinaryExpr>>) {
        write_expr(node->lhs, Context::Compact);
        emit(" ");
        emit(to_string(node->op));
        emit(" ");
        write_expr(node->rhs, Context::Compact);
      } else if constexpr (std::is_same_v<T, Box<Conditional>>) {
        write_expr(node->cond, Context::Compact);
        emit(" ? ");
        write_expr(node->true_expr, Context::Compact);
        emit(" : ");
        write_expr(node->false_expr, Context::Compact);
      } else if constexpr (std::is_same_v<T, Box<Parenthesis>>) {
        emit("(");
        write_expr(node->inner, Context::Compact);
        emit(")");
      } else if constexpr (std::is_same_v<T, Box<ForExpr>>) {
        write_for_expr(*node);
      } else {
        static_assert(k_always_false<T>, "unhandled expression alternative");
      }
    },
    expr);
}

void Formatter::write_array(const Array & array, Context ctx)
{
  if (array.elements.empty()) {
    emit("[]");
    return;
  }

  if (ctx == Context::Compact || options_.compact_arrays) {
    emit("[");
    for (size_t i = 0; i < array.elements.size(); ++i) {
      if (i > 0) {
        emit(", ");
      }
      write_expr(array.elements[i], Context::Compact);
    }
    emit("]");
    return;
  }

  emit("[");
  newline();
  {
    const IndentScope scope(*this);
    for (const auto & element : array.elements) {
      indent();
      write_expr(element, Context::Expanded);
      emit(",");
      newline();
    }
  }
  indent();
  emit("]");
}

void Formatter::write_object(const Object & object, Context ctx)
{
  if (object.items.empty()) {
    emit("{}");
    return;
  }

  if (ctx == Context::Compact || options_.compact_objects) {
    emit("{ ");
    for (size_t i = 0; i < object.items.size(); ++i) {
      if (i > 0) {
        // After a heredoc the line break already separates the items
        if (pending_newline_) {
          newline();
        } else {
          emit(", ");
        }
      }
      write_object_key(object.items[i].key);
      emit(" = ");
      write_expr(object.items[i].value, Context::Compact);
    }
    emit(" }");
    return;
  }

  emit("{");
  newline();
  {
    const IndentScope scope(*this);
    for (const auto & item : object.items) {
      indent();
      write_object_key(item.key);
      emit(" = ");
      write_expr(item.value, Context::Expanded);
      newline();
    }
  }
  indent();
  emit("}");
}

void Formatter::write_object_key(const ObjectKey & key)
{
  if (const auto * ident = std::get_if<Identifier>(&key)) {
    emit(ident->as_str());
    return;
  }

  const auto & expr = std::get<Expression>(key);
  if (options_.prefer_ident_keys) {
    if (const auto * text = std::get_if<std::string>(&expr); text && Identifier::is_valid(*text)) {
      emit(*text);
      return;
    }
  }
  write_expr(expr, Context::Compact);
}

void Formatter::write_func_call(const FuncCall & call)
{
  for (const auto & ns : call.name.namespace_path) {
    emit(ns.as_str());
    emit("::");
  }
  emit(call.name.name.as_str());
  emit("(");
  for (size_t i = 0; i < call.args.size(); ++i) {
    if (i > 0) {
      emit(", ");
    }
    write_expr(call.args[i], Context::Compact);
  }
  if (call.expand_final && !call.args.empty()) {
    emit("...");
  }
  emit(")");
}

void Formatter::write_traversal(const Traversal & traversal)
{
  write_expr(traversal.expr, Context::Compact);

  // `1.0` would lex as a float; keep an integer base apart from a legacy index
  if (const auto * n = std::get_if<Number>(&traversal.expr);
      n != nullptr && n->kind() != Number::Kind::Float && !traversal.operators.empty() &&
      std::holds_alternative<LegacyIndex>(traversal.operators.front())) {
    emit(" ");
  }

  for (const auto & op : traversal.operators) {
    if (const auto * attr = std::get_if<GetAttr>(&op)) {
      emit(".");
      emit(attr->name.as_str());
    } else if (const auto * index = std::get_if<Index>(&op)) {
      emit("[");
      write_expr(index->expr, Context::Compact);
      emit("]");
    } else if (const auto * legacy = std::get_if<LegacyIndex>(&op)) {
      emit(fmt::format(".{}", legacy->index));
    } else if (std::holds_alternative<AttrSplat>(op)) {
      emit(".*");
    } else {
      emit("[*]");
    }
  }
}

void Formatter::write_for_expr(const ForExpr & expr)
{
  const bool object = expr.key_expr.has_value();
  emit(object ? "{for " : "[for ");
  if (expr.key_var) {
    emit(expr.key_var->as_str());
    emit(", ");
  }
  emit(expr.value_var.as_str());
  emit(" in ");
  write_expr(expr.collection_expr, Context::Compact);
  emit(" : ");
  if (object) {
    write_expr(*expr.key_expr, Context::Compact);
    emit(" => ");
  }
  write_expr(expr.value_expr, Context::Compact);
  if (object && expr.grouping) {
    emit("...");
  }
  if (expr.cond_expr) {
    emit(" if ");
    write_expr(*expr.cond_expr, Context::Compact);
  }
  emit(object ? "}" : "]");
}

// ============================================================================
// Strings and templates
// ============================================================================

void Formatter::write_heredoc(const Heredoc & heredoc)
{
  emit("<<");
  if (heredoc.strip == HeredocStrip::Indent) {
    emit("-");
  }
  emit(heredoc.delimiter.as_str());
  newline();

  write_template(heredoc.tmpl, false);
  if (!ends_with_newline(heredoc.tmpl)) {
    newline();
  }
  emit(heredoc.delimiter.as_str());
  pending_newline_ = true;
}

void Formatter::write_quoted_string(std::string_view text)
{
  emit("\"");
  write_literal(text, true);
  emit("\"");
}

void Formatter::write(const Template & tmpl) { write_template(tmpl, false); }

void Formatter::write_template(const Template & tmpl, bool quoted)
{
  for (const auto & element : tmpl.elements) {
    if (const auto * text = std::get_if<std::string>(&element)) {
      write_literal(*text, quoted);
    } else if (const auto * interp = std::get_if<Interpolation>(&element)) {
      emit(interp->strip.left ? "${~" : "${");
      write_expr(interp->expr, Context::Compact);
      emit(interp->strip.right ? "~}" : "}");
    } else if (const auto * if_dir = std::get_if<Box<IfDirective>>(&element)) {
      write_if_directive(**if_dir, quoted);
    } else {
      write_for_directive(*std::get<Box<ForDirective>>(element), quoted);
    }
  }
}

void Formatter::write_directive_open(std::string_view keyword, bool strip)
{
  emit(strip ? "%{~ " : "%{ ");
  emit(keyword);
}

void Formatter::write_directive_close(bool strip) { emit(strip ? " ~}" : " }"); }

void Formatter::write_if_directive(const IfDirective & directive, bool quoted)
{
  write_directive_open("if", directive.if_strip.left);
  emit(" ");
  write_expr(directive.cond, Context::Compact);
  write_directive_close(directive.if_strip.right);

  write_template(directive.true_template, quoted);

  if (directive.false_template) {
    write_directive_open("else", directive.else_strip.left);
    write_directive_close(directive.else_strip.right);
    write_template(*directive.false_template, quoted);
  }

  write_directive_open("endif", directive.endif_strip.left);
  write_directive_close(directive.endif_strip.right);
}

void Formatter::write_for_directive(const ForDirective & directive, bool quoted)
{
  write_directive_open("for", directive.for_strip.left);
  emit(" ");
  if (directive.key_var) {
    emit(directive.key_var->as_str());
    emit(", ");
  }
  emit(directive.value_var.as_str());
  emit(" in ");
  write_expr(directive.collection, Context::Compact);
  write_directive_close(directive.for_strip.right);

  write_template(directive.body, quoted);

  write_directive_open("endfor", directive.endfor_strip.left);
  write_directive_close(directive.endfor_strip.right);
}

/// Quoted literals escape quotes, backslashes and control characters;
/// every literal escapes the `${` and `%{` template openers.
void Formatter::write_literal(std::string_view text, bool quoted)
{
  std::string out;
  out.reserve(text.size());

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if ((c == '$' || c == '%') && i + 1 < text.size() && text[i + 1] == '{') {
      out.push_back(c);
      out.push_back(c);
      out.push_back('{');
      ++i;
      continue;
    }
    if (!quoted) {
      out.push_back(c);
      continue;
    }
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default: {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F) {
          out += fmt::format("\\u{:04X}", static_cast<unsigned>(u));
        } else {
          out.push_back(c);
        }
        break;
      }
    }
  }

  emit(out);
}

// ============================================================================
// Entry points
// ============================================================================

namespace
{

template <typename Node>
std::string render_string(const Node & node, const FormatterOptions & options)
{
  std::ostringstream os;
  Formatter formatter(os, options);
  formatter.write(node);
  return os.str();
}

template <typename Node>
std::expected<void, FormatError> render_stream(
  std::ostream & os, const Node & node, const FormatterOptions & options)
{
  Formatter formatter(os, options);
  formatter.write(node);
  if (!os) {
    return std::unexpected(FormatError{"failed to write to output stream"});
  }
  return {};
}

}  // namespace

std::string to_string(const Body & body, const FormatterOptions & options)
{
  return render_string(body, options);
}

std::string to_string(const Structure & structure, const FormatterOptions & options)
{
  return render_string(structure, options);
}

std::string to_string(const Attribute & attr, const FormatterOptions & options)
{
  return render_string(attr, options);
}

std::string to_string(const Block & block, const FormatterOptions & options)
{
  return render_string(block, options);
}

std::string to_string(const Expression & expr, const FormatterOptions & options)
{
  return render_string(expr, options);
}

std::string to_string(const Template & tmpl, const FormatterOptions & options)
{
  return render_string(tmpl, options);
}

std::expected<std::string, FormatError> format(const Body & body, const FormatterOptions & options)
{
  return render_string(body, options);
}

std::expected<std::string, FormatError> format(
  const Structure & structure, const FormatterOptions & options)
{
  return render_string(structure, options);
}

std::expected<std::string, FormatError> format(
  const Attribute & attr, const FormatterOptions & options)
{
  return render_string(attr, options);
}

std::expected<std::string, FormatError> format(
  const Block & block, const FormatterOptions & options)
{
  return render_string(block, options);
}

std::expected<std::string, FormatError> format(
  const Expression & expr, const FormatterOptions & options)
{
  return render_string(expr, options);
}

std::expected<std::string, FormatError> format(
  const Template & tmpl, const FormatterOptions & options)
{
  return render_string(tmpl, options);
}

std::expected<void, FormatError> format_to(
  std::ostream & os, const Body & body, const FormatterOptions & options)
{
  return render_stream(os, body, options);
}

std::expected<void, FormatError> format_to(
  std::ostream & os, const Structure & structure, const FormatterOptions & options)
{
  return render_stream(os, structure, options);
}

std::expected<void, FormatError> format_to(
  std::ostream & os, const Attribute & attr, const FormatterOptions & options)
{
  return render_stream(os, attr, options);
}

std::expected<void, FormatError> format_to(
  std::ostream & os, const Block & block, const FormatterOptions & options)
{
  return render_stream(os, block, options);
}

std::expected<void, FormatError> format_to(
  std::ostream & os, const Expression & expr, const FormatterOptions & options)
{
  return render_stream(os, expr, options);
}

std::expected<void, FormatError> format_to(
  std::ostream & os, const Template & tmpl, const FormatterOptions & options)
{
  return render_stream(os, tmpl, options);
}

}  // namespace hcl
