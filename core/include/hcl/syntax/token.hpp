#pragma once

#include <cstdint>
#include <string_view>

#include "hcl/basic/source_manager.hpp"

namespace hcl::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // unrecognized character, unterminated comment

  Newline,  // \n or \r\n

  // Comments (filtered by the parser)
  LineComment,   // # ... or // ...
  BlockComment,  // /* ... */

  Identifier,
  NumberLiteral,

  // Templates
  OQuote,           // opening "
  CQuote,           // closing "
  TemplateLiteral,  // raw literal text inside a template (escapes not yet processed)
  TemplateInterp,   // ${ or ${~
  TemplateControl,  // %{ or %{~
  TemplateSeqEnd,   // } or ~} closing an interpolation or directive
  HeredocBegin,     // <<MARKER or <<-MARKER including the line break
  HeredocEnd,       // closing marker line (leading whitespace + marker)

  // Punctuation / operators
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  DoubleColon,
  Dot,
  Ellipsis,
  Question,
  FatArrow,

  Bang,
  Plus,
  Minus,
  Star,
  Slash,
  Percent,

  AndAnd,
  OrOr,

  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;
  std::string_view text;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "eof";
    case TokenKind::Unknown:
      return "unknown";
    case TokenKind::Newline:
      return "newline";
    case TokenKind::LineComment:
      return "line_comment";
    case TokenKind::BlockComment:
      return "block_comment";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::NumberLiteral:
      return "number";
    case TokenKind::OQuote:
      return "\"";
    case TokenKind::CQuote:
      return "\"";
    case TokenKind::TemplateLiteral:
      return "template_literal";
    case TokenKind::TemplateInterp:
      return "${";
    case TokenKind::TemplateControl:
      return "%{";
    case TokenKind::TemplateSeqEnd:
      return "}";
    case TokenKind::HeredocBegin:
      return "<<";
    case TokenKind::HeredocEnd:
      return "heredoc_end";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::DoubleColon:
      return "::";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Ellipsis:
      return "...";
    case TokenKind::Question:
      return "?";
    case TokenKind::FatArrow:
      return "=>";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
  }
  return "<invalid>";
}

}  // namespace hcl::syntax
