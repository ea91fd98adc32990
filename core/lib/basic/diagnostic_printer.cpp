// hcl/basic/diagnostic_printer.cpp - Pointer-annotated parse error output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "hcl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <sstream>
#include <string>

#include "hcl/basic/source_manager.hpp"

namespace hcl
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const ParseError & err) { print_impl(err, err.source_line()); }

void DiagnosticPrinter::print(const ParseError & err, std::string_view source)
{
  const SourceFile file(source);
  print_impl(err, file.get_line(err.line() - 1));
}

void DiagnosticPrinter::print_impl(const ParseError & err, std::string_view line_text)
{
  const std::string line_no = fmt::format("{}", err.line());
  const size_t pad = line_no.size();
  const std::string caret_indent(err.column() > 0 ? err.column() - 1 : 0, ' ');

  // === Location line ===
  print_gutter_arrow(pad);
  fmt::print(os_, " HCL parse error in line {}, column {}\n", err.line(), err.column());
  print_gutter_pipe(pad);
  os_ << "\n";

  // === Source line ===
  if (use_color_) {
    os_ << rang::fg::blue << rang::style::bold << line_no << " |" << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, " {}\n", line_text);
  } else {
    fmt::print(os_, "{} | {}\n", line_no, line_text);
  }

  // === Pointer line ===
  print_gutter_pipe(pad);
  fmt::print(os_, " {}", caret_indent);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << "^---" << rang::style::reset << rang::fg::reset
        << "\n";
  } else {
    os_ << "^---\n";
  }
  print_gutter_pipe(pad);
  os_ << "\n";

  // === Cause line ===
  if (use_color_) {
    os_ << std::string(pad + 1, ' ') << rang::fg::blue << rang::style::bold << "="
        << rang::style::reset << rang::fg::reset << " " << rang::style::bold << err.category()
        << rang::style::reset;
    if (!err.expected().empty()) {
      fmt::print(os_, "; expected {}", format_expected_list(err.expected()));
    }
  } else {
    fmt::print(os_, "{} = {}", std::string(pad, ' '), err.cause());
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_gutter_arrow(size_t pad)
{
  os_ << std::string(pad, ' ');
  if (use_color_) {
    os_ << rang::fg::blue << rang::style::bold << "-->" << rang::style::reset << rang::fg::reset;
  } else {
    os_ << "-->";
  }
}

void DiagnosticPrinter::print_gutter_pipe(size_t pad)
{
  os_ << std::string(pad + 1, ' ');
  if (use_color_) {
    os_ << rang::fg::blue << rang::style::bold << "|" << rang::style::reset << rang::fg::reset;
  } else {
    os_ << "|";
  }
}

std::string render(const ParseError & err)
{
  std::ostringstream os;
  DiagnosticPrinter(os, false).print(err);
  return os.str();
}

std::string render(const ParseError & err, std::string_view source)
{
  std::ostringstream os;
  DiagnosticPrinter(os, false).print(err, source);
  return os.str();
}

}  // namespace hcl
