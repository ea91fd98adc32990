// hcl/hcl.hpp - Public API umbrella header
//
// Parsing:    hcl::parse_body / parse_expression / parse_template
// Formatting: hcl::to_string / format / format_to
// Errors:     hcl::ParseError (rendered via message() or DiagnosticPrinter)
//
#pragma once

#include "hcl/ast/builder.hpp"
#include "hcl/ast/expr.hpp"
#include "hcl/ast/identifier.hpp"
#include "hcl/ast/number.hpp"
#include "hcl/ast/structure.hpp"
#include "hcl/basic/diagnostic.hpp"
#include "hcl/basic/diagnostic_printer.hpp"
#include "hcl/format/formatter.hpp"
#include "hcl/syntax/frontend.hpp"
