// hcl/syntax/parse_template.cpp - Quoted strings, heredocs and templates
//
#include <algorithm>
#include <limits>
#include <utility>

#include "hcl/syntax/expected.hpp"
#include "hcl/syntax/keywords.hpp"
#include "hcl/syntax/parser.hpp"
#include "parser_scopes.hpp"

namespace hcl::syntax
{

namespace
{

void append_utf8(std::string & out, uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

std::optional<uint32_t> hex_value(char h)
{
  if (h >= '0' && h <= '9') {
    return static_cast<uint32_t>(h - '0');
  }
  if (h >= 'a' && h <= 'f') {
    return static_cast<uint32_t>(10 + (h - 'a'));
  }
  if (h >= 'A' && h <= 'F') {
    return static_cast<uint32_t>(10 + (h - 'A'));
  }
  return std::nullopt;
}

bool is_indent(char c) { return c == ' ' || c == '\t'; }

/**
 * Remove the common leading whitespace of all non-blank lines (`<<-`).
 *
 * A line that begins with an interpolation or directive has no indentation,
 * so it forces the common indent to zero.
 */
void dedent(Template & tmpl)
{
  size_t min_indent = std::numeric_limits<size_t>::max();
  bool line_start = true;

  for (size_t e = 0; e < tmpl.elements.size(); ++e) {
    const auto * text = std::get_if<std::string>(&tmpl.elements[e]);
    if (text == nullptr) {
      if (line_start) {
        min_indent = 0;
      }
      line_start = false;
      continue;
    }

    size_t i = 0;
    while (i < text->size()) {
      if (line_start) {
        size_t n = 0;
        while (i + n < text->size() && is_indent((*text)[i + n])) {
          ++n;
        }
        const size_t j = i + n;
        if (j < text->size() && ((*text)[j] == '\n' || (*text)[j] == '\r')) {
          // Blank line
          i = text->find('\n', j);
          i = (i == std::string::npos) ? text->size() : i + 1;
          continue;
        }
        if (j < text->size() || e + 1 < tmpl.elements.size()) {
          min_indent = std::min(min_indent, n);
        }
        line_start = false;
        i = j;
        continue;
      }
      const size_t nl = text->find('\n', i);
      if (nl == std::string::npos) {
        break;
      }
      i = nl + 1;
      line_start = true;
    }
  }

  if (min_indent == 0 || min_indent == std::numeric_limits<size_t>::max()) {
    return;
  }

  line_start = true;
  for (auto & element : tmpl.elements) {
    auto * text = std::get_if<std::string>(&element);
    if (text == nullptr) {
      line_start = false;
      continue;
    }

    std::string out;
    out.reserve(text->size());
    size_t i = 0;
    while (i < text->size()) {
      if (line_start) {
        size_t n = 0;
        while (n < min_indent && i + n < text->size() && is_indent((*text)[i + n])) {
          ++n;
        }
        i += n;
        line_start = false;
        continue;
      }
      const char c = (*text)[i++];
      out.push_back(c);
      if (c == '\n') {
        line_start = true;
      }
    }
    *text = std::move(out);
  }

  std::erase_if(tmpl.elements, [](const TemplateElement & element) {
    const auto * text = std::get_if<std::string>(&element);
    return text != nullptr && text->empty();
  });
}

}  // namespace

// ============================================================================
// Strings
// ============================================================================

Expression Parser::parse_quoted_string()
{
  advance();  // opening quote
  NewlineScope scope(*this, false);

  Template tmpl = parse_template_elements(TemplateContext::Quoted);
  if (!check(TokenKind::CQuote, expect::k_quote)) {
    fail(category::k_invalid_string);
    return Null{};
  }
  advance();

  if (tmpl.elements.empty()) {
    return std::string();
  }
  if (tmpl.elements.size() == 1) {
    if (auto * text = std::get_if<std::string>(&tmpl.elements.front())) {
      return std::move(*text);
    }
  }
  return Box<TemplateExpr>(TemplateExpr{std::move(tmpl)});
}

Expression Parser::parse_heredoc()
{
  // `<<MARKER\n` or `<<-MARKER\n`
  std::string_view text = cur().text;
  const bool indent = text.size() > 2 && text[2] == '-';
  text.remove_prefix(indent ? 3 : 2);
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  Identifier delimiter(text);
  advance();

  NewlineScope scope(*this, false);
  Template tmpl = parse_template_elements(TemplateContext::Heredoc);
  if (!check(TokenKind::HeredocEnd, expect::k_heredoc_end)) {
    fail(category::k_invalid_heredoc);
    return Null{};
  }
  advance();

  if (indent) {
    dedent(tmpl);
  }
  return Box<Heredoc>(Heredoc{
    std::move(delimiter), std::move(tmpl), indent ? HeredocStrip::Indent : HeredocStrip::None});
}

// ============================================================================
// Template elements
// ============================================================================

Template Parser::parse_template_elements(TemplateContext ctx)
{
  Template tmpl;

  while (!failed()) {
    const Token & tok = cur();

    if (tok.kind == TokenKind::TemplateLiteral) {
      auto text = unescape_literal(tok, ctx);
      if (!text) {
        break;
      }
      advance();
      if (text->empty()) {
        continue;
      }
      if (!tmpl.elements.empty()) {
        if (auto * prev = std::get_if<std::string>(&tmpl.elements.back())) {
          *prev += *text;
          continue;
        }
      }
      tmpl.elements.emplace_back(std::move(*text));
      continue;
    }

    if (tok.kind == TokenKind::TemplateInterp) {
      auto interp = parse_interpolation();
      if (!interp) {
        break;
      }
      tmpl.elements.emplace_back(std::move(*interp));
      continue;
    }

    if (tok.kind == TokenKind::TemplateControl) {
      if (at_directive(k_if)) {
        auto directive = parse_if_directive(ctx);
        if (!directive) {
          break;
        }
        tmpl.elements.emplace_back(Box<IfDirective>(std::move(*directive)));
        continue;
      }
      if (at_directive(k_for)) {
        auto directive = parse_for_directive(ctx);
        if (!directive) {
          break;
        }
        tmpl.elements.emplace_back(Box<ForDirective>(std::move(*directive)));
        continue;
      }
      // else/endif/endfor close the enclosing directive
      if (std::any_of(k_directive_terminators.begin(), k_directive_terminators.end(),
                      [this](std::string_view kw) { return at_directive(kw); })) {
        break;
      }

      NewlineScope scope(*this, true);
      fail_at(cur(1).begin(), category::k_invalid_directive, {expect::k_if, expect::k_for});
    }

    break;
  }

  return tmpl;
}

std::optional<Interpolation> Parser::parse_interpolation()
{
  StripMarkers strip;
  strip.left = cur().text.ends_with('~');
  advance();

  NewlineScope scope(*this, true);
  Expression expr = parse_expr();
  if (!check(TokenKind::TemplateSeqEnd, expect::k_seq_end)) {
    fail(category::k_invalid_interpolation);
    return std::nullopt;
  }
  strip.right = cur().text.starts_with('~');
  advance();

  return Interpolation{std::move(expr), strip};
}

// ============================================================================
// Directives
// ============================================================================

bool Parser::at_directive(std::string_view kw)
{
  if (!at(TokenKind::TemplateControl)) {
    return false;
  }
  NewlineScope scope(*this, true);
  const Token & next = cur(1);
  return next.kind == TokenKind::Identifier && next.text == kw;
}

/// `%{ kw` ; yields the left strip marker.
std::optional<bool> Parser::parse_directive_open(std::string_view kw, Expected what)
{
  if (!check(TokenKind::TemplateControl, expect::k_directive_open)) {
    fail(category::k_invalid_directive);
    return std::nullopt;
  }
  const bool strip = cur().text.ends_with('~');
  advance();

  NewlineScope scope(*this, true);
  if (!check_keyword(kw, what)) {
    fail(category::k_invalid_directive);
    return std::nullopt;
  }
  advance();
  return strip;
}

/// `}` or `~}` ; yields the right strip marker.
std::optional<bool> Parser::parse_directive_close()
{
  NewlineScope scope(*this, true);
  if (!check(TokenKind::TemplateSeqEnd, expect::k_seq_end)) {
    fail(category::k_invalid_directive);
    return std::nullopt;
  }
  const bool strip = cur().text.starts_with('~');
  advance();
  return strip;
}

std::optional<IfDirective> Parser::parse_if_directive(TemplateContext ctx)
{
  DepthGuard guard(*this);
  IfDirective directive;

  auto open = parse_directive_open(k_if, expect::k_if);
  if (!open) {
    return std::nullopt;
  }
  directive.if_strip.left = *open;
  {
    NewlineScope scope(*this, true);
    directive.cond = parse_expr();
  }
  auto close = parse_directive_close();
  if (!close) {
    return std::nullopt;
  }
  directive.if_strip.right = *close;

  directive.true_template = parse_template_elements(ctx);
  if (failed()) {
    return std::nullopt;
  }

  if (at_directive(k_else)) {
    open = parse_directive_open(k_else, expect::k_else);
    close = open ? parse_directive_close() : std::nullopt;
    if (!close) {
      return std::nullopt;
    }
    directive.else_strip = StripMarkers{*open, *close};
    directive.false_template = parse_template_elements(ctx);
    if (failed()) {
      return std::nullopt;
    }
  }

  open = parse_directive_open(k_endif, expect::k_endif);
  close = open ? parse_directive_close() : std::nullopt;
  if (!close) {
    return std::nullopt;
  }
  directive.endif_strip = StripMarkers{*open, *close};
  return directive;
}

std::optional<ForDirective> Parser::parse_for_directive(TemplateContext ctx)
{
  DepthGuard guard(*this);

  auto open = parse_directive_open(k_for, expect::k_for);
  if (!open) {
    return std::nullopt;
  }

  std::optional<Identifier> key_var;
  std::optional<Identifier> value_var;
  Expression collection;
  {
    NewlineScope scope(*this, true);
    if (!check(TokenKind::Identifier, expect::k_identifier)) {
      fail(category::k_invalid_directive);
      return std::nullopt;
    }
    value_var = make_identifier(cur());
    advance();

    if (check(TokenKind::Comma, expect::k_comma)) {
      advance();
      if (!check(TokenKind::Identifier, expect::k_identifier)) {
        fail(category::k_invalid_directive);
        return std::nullopt;
      }
      key_var = std::move(value_var);
      value_var = make_identifier(cur());
      advance();
    }

    if (!check_keyword(k_in, expect::k_in)) {
      fail(category::k_invalid_directive);
      return std::nullopt;
    }
    advance();
    collection = parse_expr();
  }

  auto close = parse_directive_close();
  if (!close) {
    return std::nullopt;
  }
  const StripMarkers for_strip{*open, *close};

  Template body = parse_template_elements(ctx);
  if (failed()) {
    return std::nullopt;
  }

  open = parse_directive_open(k_endfor, expect::k_endfor);
  close = open ? parse_directive_close() : std::nullopt;
  if (!close) {
    return std::nullopt;
  }

  return ForDirective{
    std::move(key_var), std::move(*value_var), std::move(collection), std::move(body),
    for_strip, StripMarkers{*open, *close}};
}

// ============================================================================
// Escapes
// ============================================================================

std::optional<std::string> Parser::unescape_literal(const Token & tok, TemplateContext ctx)
{
  const std::string_view raw = tok.text;
  std::string out;
  out.reserve(raw.size());

  size_t i = 0;
  while (i < raw.size()) {
    const std::string_view rest = raw.substr(i);

    // `$${` and `%%{` stand for a literal `${` and `%{`
    if (rest.starts_with("$${") || rest.starts_with("%%{")) {
      out.push_back(raw[i]);
      out.push_back('{');
      i += 3;
      continue;
    }

    if (ctx != TemplateContext::Quoted || raw[i] != '\\') {
      out.push_back(raw[i]);
      ++i;
      continue;
    }

    const uint32_t backslash = tok.begin() + static_cast<uint32_t>(i);
    const char esc = (i + 1 < raw.size()) ? raw[i + 1] : '\0';
    switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case '"':
        out.push_back('"');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case 'u':
      case 'U': {
        const size_t digits = (esc == 'u') ? 4 : 8;
        uint32_t cp = 0;
        for (size_t k = 0; k < digits; ++k) {
          const size_t j = i + 2 + k;
          const auto v = (j < raw.size()) ? hex_value(raw[j]) : std::nullopt;
          if (!v) {
            fail_at(
              tok.begin() + static_cast<uint32_t>(j), category::k_invalid_unicode_escape,
              {expect::k_hex_digit});
            return std::nullopt;
          }
          cp = (cp << 4) | *v;
        }
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
          fail_at(backslash, category::k_invalid_unicode_escape);
          return std::nullopt;
        }
        append_utf8(out, cp);
        i += digits;
        break;
      }
      default:
        fail_at(
          backslash + 1, category::k_invalid_escape_sequence,
          {expect::k_escape_chars.begin(), expect::k_escape_chars.end()});
        return std::nullopt;
    }
    i += 2;
  }

  return out;
}

}  // namespace hcl::syntax
