// hcl/basic/diagnostic_printer.hpp
//
// Renders parse errors with a source excerpt and a pointer under the failing
// column.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "hcl/basic/diagnostic.hpp"

namespace hcl
{

/**
 * Prints parse errors in the fixed HCL diagnostic shape.
 *
 * Produces output like:
 *    --> HCL parse error in line 2, column 5
 *     |
 *   2 | bar [
 *     |     ^---
 *     |
 *     = invalid structure; expected `{`, `=`, `"` or identifier
 *
 * The gutter width follows the number of digits of the line number. No
 * trailing newline is written. With colors disabled the output is exactly the
 * text returned by render().
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print using the source line captured in the error.
  void print(const ParseError & err);

  /// Print using the line of `source` the error points into.
  void print(const ParseError & err, std::string_view source);

private:
  void print_impl(const ParseError & err, std::string_view line_text);

  // Gutter elements
  void print_gutter_arrow(size_t pad);
  void print_gutter_pipe(size_t pad);

  std::ostream & os_;
  bool use_color_;
};

/// Render a parse error as plain text using its captured source line.
[[nodiscard]] std::string render(const ParseError & err);

/// Render a parse error as plain text, taking the source line from `source`.
[[nodiscard]] std::string render(const ParseError & err, std::string_view source);

}  // namespace hcl
