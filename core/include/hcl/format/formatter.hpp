// hcl/format/formatter.hpp - Canonical text rendering of the model
//
// Rendering is a pure function of the model and the options. The output of
// every entry point parses back to an equal model (see DESIGN.md for the
// handful of shapes that cannot be spelled in the grammar).
//
#pragma once

#include <cstdint>
#include <expected>
#include <ostream>
#include <string>
#include <string_view>

#include "hcl/ast/expr.hpp"
#include "hcl/ast/structure.hpp"
#include "hcl/basic/diagnostic.hpp"

namespace hcl
{

struct FormatterOptions
{
  /// Spaces per nesting level.
  uint32_t indent_width = 2;
  /// Omit the blank line that otherwise separates blocks from their neighbours.
  bool dense = false;
  /// Render arrays on one line even where objects would be expanded.
  bool compact_arrays = true;
  /// Render every object on one line.
  bool compact_objects = false;
  /// Render string object keys that are valid identifiers without quotes.
  bool prefer_ident_keys = false;

  bool operator==(const FormatterOptions &) const = default;
};

// ============================================================================
// Formatter
// ============================================================================

/**
 * Streams canonical text for model nodes.
 *
 * Whether a collection is expanded over several lines depends only on where
 * it appears, never on its length:
 * - objects are expanded as attribute values, as values of an expanded
 *   object, as elements of an expanded array and at the top level;
 * - everywhere else they render as `{ k = v, k2 = v2 }`.
 *
 * Usage:
 * @code
 *   Formatter formatter(std::cout);
 *   formatter.write(body);
 * @endcode
 */
class Formatter
{
public:
  explicit Formatter(std::ostream & os, FormatterOptions options = {}) : os_(os), options_(options)
  {
  }

  void write(const Body & body);
  void write(const Structure & structure);
  void write(const Attribute & attr);
  void write(const Block & block);
  void write(const Expression & expr);
  /// Bare template text, as in a template file.
  void write(const Template & tmpl);

private:
  enum class Context : uint8_t {
    Expanded,  // objects may span lines
    Compact,   // everything on one line
  };

  class IndentScope;

  void write_body(const Body & body);
  void write_attribute(const Attribute & attr);
  void write_block(const Block & block);
  void write_expr(const Expression & expr, Context ctx);
  void write_array(const Array & array, Context ctx);
  void write_object(const Object & object, Context ctx);
  void write_object_key(const ObjectKey & key);
  void write_func_call(const FuncCall & call);
  void write_traversal(const Traversal & traversal);
  void write_for_expr(const ForExpr & expr);
  void write_heredoc(const Heredoc & heredoc);
  void write_quoted_string(std::string_view text);
  void write_template(const Template & tmpl, bool quoted);
  void write_if_directive(const IfDirective & directive, bool quoted);
  void write_for_directive(const ForDirective & directive, bool quoted);
  void write_literal(std::string_view text, bool quoted);
  void write_directive_open(std::string_view keyword, bool strip);
  void write_directive_close(bool strip);

  /// Emit text, first completing a line left open by a heredoc marker.
  void emit(std::string_view text);
  void newline();
  void indent();

  std::ostream & os_;
  FormatterOptions options_;
  uint32_t level_ = 0;
  // A heredoc end marker must be followed by a line break
  bool pending_newline_ = false;
};

// ============================================================================
// Entry points
// ============================================================================

[[nodiscard]] std::string to_string(const Body & body, const FormatterOptions & options = {});
[[nodiscard]] std::string to_string(
  const Structure & structure, const FormatterOptions & options = {});
[[nodiscard]] std::string to_string(const Attribute & attr, const FormatterOptions & options = {});
[[nodiscard]] std::string to_string(const Block & block, const FormatterOptions & options = {});
[[nodiscard]] std::string to_string(const Expression & expr, const FormatterOptions & options = {});
[[nodiscard]] std::string to_string(const Template & tmpl, const FormatterOptions & options = {});

[[nodiscard]] std::expected<std::string, FormatError> format(
  const Body & body, const FormatterOptions & options = {});
[[nodiscard]] std::expected<std::string, FormatError> format(
  const Structure & structure, const FormatterOptions & options = {});
[[nodiscard]] std::expected<std::string, FormatError> format(
  const Attribute & attr, const FormatterOptions & options = {});
[[nodiscard]] std::expected<std::string, FormatError> format(
  const Block & block, const FormatterOptions & options = {});
[[nodiscard]] std::expected<std::string, FormatError> format(
  const Expression & expr, const FormatterOptions & options = {});
[[nodiscard]] std::expected<std::string, FormatError> format(
  const Template & tmpl, const FormatterOptions & options = {});

/// Stream formatted text; fails when the stream reports an error.
[[nodiscard]] std::expected<void, FormatError> format_to(
  std::ostream & os, const Body & body, const FormatterOptions & options = {});
[[nodiscard]] std::expected<void, FormatError> format_to(
  std::ostream & os, const Structure & structure, const FormatterOptions & options = {});
[[nodiscard]] std::expected<void, FormatError> format_to(
  std::ostream & os, const Attribute & attr, const FormatterOptions & options = {});
[[nodiscard]] std::expected<void, FormatError> format_to(
  std::ostream & os, const Block & block, const FormatterOptions & options = {});
[[nodiscard]] std::expected<void, FormatError> format_to(
  std::ostream & os, const Expression & expr, const FormatterOptions & options = {});
[[nodiscard]] std::expected<void, FormatError> format_to(
  std::ostream & os, const Template & tmpl, const FormatterOptions & options = {});

}  // namespace hcl
