#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "hcl/syntax/token.hpp"

namespace hcl::syntax
{

/// What the input starts as: expression/body syntax or bare template text.
enum class LexerStart : uint8_t {
  Expression,
  Template,
};

/**
 * On-demand tokenizer.
 *
 * The lexer is mode-driven: quoted strings, heredocs and interpolations push
 * a mode so that template text, `${`/`%{` sequences and their closing braces
 * are tokenized precisely. It never aborts; unrecognized input becomes
 * Unknown tokens and the parser reports them. After the end of input every
 * call returns an Eof token.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src, LexerStart start = LexerStart::Expression);

  [[nodiscard]] Token next_token();

  /// Restart from the beginning of the input.
  void reset();

  /// Drain the remaining tokens, including the final Eof.
  [[nodiscard]] std::vector<Token> lex_all();

  [[nodiscard]] std::string_view source() const noexcept { return src_; }

private:
  enum class Mode : uint8_t {
    Normal,
    Interpolation,
    QuotedTemplate,
    Heredoc,
    BareTemplate,
  };

  struct Frame
  {
    Mode mode = Mode::Normal;
    uint32_t brace_depth = 0;    // Interpolation: unmatched `{` inside the sequence
    std::string_view marker;     // Heredoc: closing marker
    bool at_line_start = false;  // Heredoc: next char begins a line
  };

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;
  [[nodiscard]] size_t newline_length(size_t at) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  [[nodiscard]] Token lex_normal();
  [[nodiscard]] Token lex_quoted();
  [[nodiscard]] Token lex_heredoc();
  [[nodiscard]] Token lex_bare_template();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_comment();
  [[nodiscard]] bool try_lex_heredoc_begin(Token & out);
  [[nodiscard]] bool try_lex_template_open(Token & out);
  [[nodiscard]] Token lex_punctuation();
  [[nodiscard]] Token lex_unknown();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const noexcept;

  std::string_view src_;
  LexerStart start_;
  size_t pos_ = 0;
  std::vector<Frame> modes_;
  TokenKind last_kind_ = TokenKind::Eof;
};

}  // namespace hcl::syntax
