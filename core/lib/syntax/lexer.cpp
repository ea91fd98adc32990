#include "hcl/syntax/lexer.hpp"

#include <algorithm>

#include "hcl/ast/identifier.hpp"

namespace hcl::syntax
{

namespace
{

constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

}  // namespace

Lexer::Lexer(std::string_view src, LexerStart start) : src_(src), start_(start) { reset(); }

void Lexer::reset()
{
  pos_ = 0;
  last_kind_ = TokenKind::Eof;
  modes_.clear();
  Frame base;
  base.mode = (start_ == LexerStart::Template) ? Mode::BareTemplate : Mode::Normal;
  modes_.push_back(base);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    out.push_back(next_token());
    if (out.back().kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

Token Lexer::next_token()
{
  Token tok;
  switch (modes_.back().mode) {
    case Mode::Normal:
    case Mode::Interpolation:
      tok = lex_normal();
      break;
    case Mode::QuotedTemplate:
      tok = lex_quoted();
      break;
    case Mode::Heredoc:
      tok = lex_heredoc();
      break;
    case Mode::BareTemplate:
      tok = lex_bare_template();
      break;
  }

  if (tok.kind != TokenKind::LineComment && tok.kind != TokenKind::BlockComment) {
    last_kind_ = tok.kind;
  }
  return tok;
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.substr(pos_).starts_with(s);
}

size_t Lexer::newline_length(size_t at) const noexcept
{
  if (at < src_.size() && src_[at] == '\n') {
    return 1;
  }
  if (at + 1 < src_.size() && src_[at] == '\r' && src_[at + 1] == '\n') {
    return 2;
  }
  return 0;
}

Token Lexer::make_token(TokenKind kind, size_t start) const noexcept
{
  return Token{
    kind, SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(pos_)),
    src_.substr(start, pos_ - start)};
}

// ============================================================================
// Expression mode
// ============================================================================

Token Lexer::lex_normal()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || (c == '\r' && peek(1) != '\n')) {
      advance();
    } else {
      break;
    }
  }

  const size_t start = pos_;
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  if (const size_t nl = newline_length(pos_); nl > 0) {
    advance(nl);
    return make_token(TokenKind::Newline, start);
  }

  const char c = peek();
  if (c == '#' || starts_with("//") || starts_with("/*")) {
    return lex_comment();
  }
  if (identifier_char_length(src_.substr(pos_), true) > 0) {
    return lex_identifier();
  }
  if (is_digit(c)) {
    return lex_number();
  }
  if (c == '"') {
    advance();
    Frame quoted;
    quoted.mode = Mode::QuotedTemplate;
    modes_.push_back(quoted);
    return make_token(TokenKind::OQuote, start);
  }

  Token heredoc;
  if (c == '<' && try_lex_heredoc_begin(heredoc)) {
    return heredoc;
  }

  Frame & frame = modes_.back();
  if (frame.mode == Mode::Interpolation) {
    if (c == '{') {
      ++frame.brace_depth;
      advance();
      return make_token(TokenKind::LBrace, start);
    }
    if (frame.brace_depth == 0 && (c == '}' || starts_with("~}"))) {
      advance(c == '}' ? 1 : 2);
      modes_.pop_back();
      return make_token(TokenKind::TemplateSeqEnd, start);
    }
    if (c == '}') {
      --frame.brace_depth;
      advance();
      return make_token(TokenKind::RBrace, start);
    }
  }

  return lex_punctuation();
}

Token Lexer::lex_comment()
{
  const size_t start = pos_;

  if (starts_with("/*")) {
    advance(2);
    while (!eof() && !starts_with("*/")) {
      advance();
    }
    if (eof()) {
      return make_token(TokenKind::Unknown, start);
    }
    advance(2);
    return make_token(TokenKind::BlockComment, start);
  }

  // `#` or `//`; the line break is not part of the comment
  while (!eof() && newline_length(pos_) == 0) {
    advance();
  }
  return make_token(TokenKind::LineComment, start);
}

Token Lexer::lex_identifier()
{
  const size_t start = pos_;
  advance(identifier_char_length(src_.substr(pos_), true));
  while (const size_t len = identifier_char_length(src_.substr(pos_), false)) {
    advance(len);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;
  while (is_digit(peek())) {
    advance();
  }

  // After `.` a number is a legacy index (`a.0.1`) and takes no fraction
  if (peek() == '.' && is_digit(peek(1)) && last_kind_ != TokenKind::Dot) {
    advance();
    while (is_digit(peek())) {
      advance();
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    const size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
    if (is_digit(peek(1 + sign))) {
      advance(1 + sign);
      while (is_digit(peek())) {
        advance();
      }
    }
  }

  return make_token(TokenKind::NumberLiteral, start);
}

bool Lexer::try_lex_heredoc_begin(Token & out)
{
  if (!starts_with("<<")) {
    return false;
  }

  size_t p = pos_ + 2;
  if (p < src_.size() && src_[p] == '-') {
    ++p;
  }
  const size_t first = (p < src_.size()) ? identifier_char_length(src_.substr(p), true) : 0;
  if (first == 0) {
    return false;
  }
  const size_t marker_start = p;
  p += first;
  while (const size_t len = (p < src_.size()) ? identifier_char_length(src_.substr(p), false) : 0) {
    p += len;
  }
  const size_t nl = newline_length(p);
  if (nl == 0) {
    return false;
  }

  const size_t start = pos_;
  pos_ = p + nl;
  out = make_token(TokenKind::HeredocBegin, start);

  Frame heredoc;
  heredoc.mode = Mode::Heredoc;
  heredoc.marker = src_.substr(marker_start, p - marker_start);
  heredoc.at_line_start = true;
  modes_.push_back(heredoc);
  return true;
}

Token Lexer::lex_punctuation()
{
  const size_t start = pos_;
  const char c = peek();

  // Two-character operator if `next` follows, else the single one
  const auto pick = [&](char next, TokenKind both, TokenKind single) {
    if (peek(1) == next) {
      advance(2);
      return make_token(both, start);
    }
    advance();
    return make_token(single, start);
  };

  switch (c) {
    case '(':
      advance();
      return make_token(TokenKind::LParen, start);
    case ')':
      advance();
      return make_token(TokenKind::RParen, start);
    case '{':
      advance();
      return make_token(TokenKind::LBrace, start);
    case '}':
      advance();
      return make_token(TokenKind::RBrace, start);
    case '[':
      advance();
      return make_token(TokenKind::LBracket, start);
    case ']':
      advance();
      return make_token(TokenKind::RBracket, start);
    case ',':
      advance();
      return make_token(TokenKind::Comma, start);
    case '?':
      advance();
      return make_token(TokenKind::Question, start);
    case '+':
      advance();
      return make_token(TokenKind::Plus, start);
    case '-':
      advance();
      return make_token(TokenKind::Minus, start);
    case '*':
      advance();
      return make_token(TokenKind::Star, start);
    case '/':
      advance();
      return make_token(TokenKind::Slash, start);
    case '%':
      advance();
      return make_token(TokenKind::Percent, start);
    case ':':
      return pick(':', TokenKind::DoubleColon, TokenKind::Colon);
    case '.':
      if (starts_with("...")) {
        advance(3);
        return make_token(TokenKind::Ellipsis, start);
      }
      advance();
      return make_token(TokenKind::Dot, start);
    case '=':
      if (peek(1) == '>') {
        advance(2);
        return make_token(TokenKind::FatArrow, start);
      }
      return pick('=', TokenKind::EqEq, TokenKind::Eq);
    case '!':
      return pick('=', TokenKind::Ne, TokenKind::Bang);
    case '<':
      return pick('=', TokenKind::Le, TokenKind::Lt);
    case '>':
      return pick('=', TokenKind::Ge, TokenKind::Gt);
    case '&':
      if (peek(1) == '&') {
        advance(2);
        return make_token(TokenKind::AndAnd, start);
      }
      break;
    case '|':
      if (peek(1) == '|') {
        advance(2);
        return make_token(TokenKind::OrOr, start);
      }
      break;
    default:
      break;
  }

  return lex_unknown();
}

Token Lexer::lex_unknown()
{
  const size_t start = pos_;
  // A malformed byte is reported on its own
  advance(std::max<size_t>(utf8_sequence_length(src_.substr(pos_)), 1));
  return make_token(TokenKind::Unknown, start);
}

// ============================================================================
// Template modes
// ============================================================================

bool Lexer::try_lex_template_open(Token & out)
{
  TokenKind kind;
  if (starts_with("${")) {
    kind = TokenKind::TemplateInterp;
  } else if (starts_with("%{")) {
    kind = TokenKind::TemplateControl;
  } else {
    return false;
  }

  const size_t start = pos_;
  advance(2);
  if (peek() == '~') {
    advance();
  }
  out = make_token(kind, start);

  Frame interp;
  interp.mode = Mode::Interpolation;
  modes_.push_back(interp);
  return true;
}

Token Lexer::lex_quoted()
{
  const size_t start = pos_;
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  if (peek() == '"') {
    advance();
    modes_.pop_back();
    return make_token(TokenKind::CQuote, start);
  }

  // A raw line break ends the string; the parser reports the missing quote
  if (newline_length(pos_) > 0) {
    modes_.pop_back();
    return lex_normal();
  }

  Token open;
  if (try_lex_template_open(open)) {
    return open;
  }

  while (!eof()) {
    const char c = peek();
    if (c == '"' || newline_length(pos_) > 0) {
      break;
    }
    if (starts_with("$${") || starts_with("%%{")) {
      advance(3);
      continue;
    }
    if (starts_with("${") || starts_with("%{")) {
      break;
    }
    if (c == '\\') {
      // Keep the escaped character; the parser validates the sequence
      advance();
      if (!eof() && newline_length(pos_) == 0) {
        advance();
      }
      continue;
    }
    advance();
  }
  return make_token(TokenKind::TemplateLiteral, start);
}

Token Lexer::lex_heredoc()
{
  const size_t start = pos_;
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  Frame & frame = modes_.back();
  if (frame.at_line_start) {
    size_t p = pos_;
    while (p < src_.size() && (src_[p] == ' ' || src_[p] == '\t')) {
      ++p;
    }
    if (src_.substr(p).starts_with(frame.marker)) {
      const size_t after = p + frame.marker.size();
      if (after >= src_.size() || newline_length(after) > 0) {
        pos_ = after;
        modes_.pop_back();
        return make_token(TokenKind::HeredocEnd, start);
      }
    }
  }
  frame.at_line_start = false;

  Token open;
  if (try_lex_template_open(open)) {
    return open;
  }

  // One literal per line so the closing marker is checked at every line start
  while (!eof()) {
    if (starts_with("$${") || starts_with("%%{")) {
      advance(3);
      continue;
    }
    if (starts_with("${") || starts_with("%{")) {
      break;
    }
    if (const size_t nl = newline_length(pos_); nl > 0) {
      advance(nl);
      modes_.back().at_line_start = true;
      break;
    }
    advance();
  }
  return make_token(TokenKind::TemplateLiteral, start);
}

Token Lexer::lex_bare_template()
{
  const size_t start = pos_;
  if (eof()) {
    return make_token(TokenKind::Eof, start);
  }

  Token open;
  if (try_lex_template_open(open)) {
    return open;
  }

  while (!eof()) {
    if (starts_with("$${") || starts_with("%%{")) {
      advance(3);
      continue;
    }
    if (starts_with("${") || starts_with("%{")) {
      break;
    }
    advance();
  }
  return make_token(TokenKind::TemplateLiteral, start);
}

}  // namespace hcl::syntax
