// hcl/ast/identifier.hpp - Validated bare identifiers
#pragma once

#include <compare>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace hcl
{

/// First character of an identifier: ASCII letter, `_` or a non-ASCII lead byte.
[[nodiscard]] constexpr bool is_identifier_start(char ch) noexcept
{
  const auto c = static_cast<unsigned char>(ch);
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c >= 0x80;
}

/// Subsequent identifier characters additionally allow digits and `-`.
[[nodiscard]] constexpr bool is_identifier_continue(char ch) noexcept
{
  const auto c = static_cast<unsigned char>(ch);
  return is_identifier_start(ch) || (c >= '0' && c <= '9') || c == '-';
}

/**
 * Byte length of the well-formed UTF-8 sequence at the front of `s`.
 *
 * Returns 0 for stray continuation bytes, overlong forms, surrogates, code
 * points above U+10FFFF and truncated sequences.
 */
[[nodiscard]] constexpr size_t utf8_sequence_length(std::string_view s) noexcept
{
  if (s.empty()) {
    return 0;
  }
  const auto b0 = static_cast<unsigned char>(s[0]);
  if (b0 < 0x80) {
    return 1;
  }

  size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) {
      lo = 0xA0;
    } else if (b0 == 0xED) {
      hi = 0x9F;
    }
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) {
      lo = 0x90;
    } else if (b0 == 0xF4) {
      hi = 0x8F;
    }
  } else {
    return 0;
  }

  if (s.size() < len) {
    return 0;
  }
  const auto b1 = static_cast<unsigned char>(s[1]);
  if (b1 < lo || b1 > hi) {
    return 0;
  }
  for (size_t i = 2; i < len; ++i) {
    const auto b = static_cast<unsigned char>(s[i]);
    if (b < 0x80 || b > 0xBF) {
      return 0;
    }
  }
  return len;
}

/**
 * Byte length of the identifier character at the front of `s`, or 0 when `s`
 * does not start with one. Non-ASCII characters must be well-formed UTF-8.
 */
[[nodiscard]] constexpr size_t identifier_char_length(std::string_view s, bool first) noexcept
{
  if (s.empty()) {
    return 0;
  }
  if (static_cast<unsigned char>(s[0]) >= 0x80) {
    return utf8_sequence_length(s);
  }
  const bool ok = first ? is_identifier_start(s[0]) : is_identifier_continue(s[0]);
  return ok ? 1 : 0;
}

/**
 * Thrown when an Identifier is constructed from a string that does not match
 * the identifier grammar.
 */
class InvalidIdentifier : public std::invalid_argument
{
public:
  explicit InvalidIdentifier(std::string_view name);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

private:
  std::string name_;
};

/**
 * A string guaranteed to match the bare-identifier grammar.
 *
 * Construction from an invalid string throws InvalidIdentifier. Use
 * is_valid() to check first when the input is untrusted.
 */
class Identifier
{
public:
  explicit Identifier(std::string name);
  explicit Identifier(std::string_view name) : Identifier(std::string(name)) {}
  explicit Identifier(const char * name) : Identifier(std::string(name)) {}

  [[nodiscard]] static bool is_valid(std::string_view name) noexcept;

  [[nodiscard]] const std::string & as_str() const noexcept { return name_; }
  [[nodiscard]] std::string into_string() && noexcept { return std::move(name_); }

  bool operator==(const Identifier &) const = default;
  auto operator<=>(const Identifier &) const = default;

private:
  std::string name_;
};

inline std::ostream & operator<<(std::ostream & os, const Identifier & id)
{
  return os << id.as_str();
}

}  // namespace hcl
