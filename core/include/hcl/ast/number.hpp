// hcl/ast/number.hpp - Numeric literal values
#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace hcl
{

/**
 * A finite number: unsigned integer, negative integer or double.
 *
 * Non-negative integers are always stored as PosInt and NegInt only holds
 * values below zero, so equal integers compare equal regardless of how they
 * were constructed. Integers and floats never compare equal to each other.
 */
class Number
{
public:
  enum class Kind : uint8_t {
    PosInt,
    NegInt,
    Float,
  };

  constexpr Number() noexcept = default;
  constexpr explicit Number(uint64_t v) noexcept : kind_(Kind::PosInt), u_(v) {}
  constexpr explicit Number(int64_t v) noexcept
  : kind_(v < 0 ? Kind::NegInt : Kind::PosInt), u_(v < 0 ? 0 : static_cast<uint64_t>(v)), i_(v)
  {
  }
  constexpr explicit Number(int v) noexcept : Number(static_cast<int64_t>(v)) {}

  /// Returns std::nullopt for NaN and infinities.
  [[nodiscard]] static std::optional<Number> from_f64(double v) noexcept;

  /**
   * Parse a decimal literal as produced by the lexer (digits, optional
   * fraction, optional exponent). Integers that do not fit 64 bits become
   * doubles. Returns std::nullopt when the value is not finite.
   */
  [[nodiscard]] static std::optional<Number> parse(std::string_view text);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] bool is_u64() const noexcept { return kind_ == Kind::PosInt; }
  [[nodiscard]] bool is_i64() const noexcept
  {
    return kind_ == Kind::NegInt || (kind_ == Kind::PosInt && u_ <= INT64_MAX);
  }
  [[nodiscard]] bool is_f64() const noexcept { return kind_ == Kind::Float; }

  [[nodiscard]] std::optional<uint64_t> as_u64() const noexcept;
  [[nodiscard]] std::optional<int64_t> as_i64() const noexcept;
  [[nodiscard]] double as_f64() const noexcept;

  /// Arithmetic negation. Integers that leave the 64-bit range become doubles.
  [[nodiscard]] Number operator-() const noexcept;

  /// Canonical text; floats always carry a fraction or exponent.
  [[nodiscard]] std::string to_string() const;

  bool operator==(const Number & other) const noexcept;

private:
  Kind kind_ = Kind::PosInt;
  uint64_t u_ = 0;
  int64_t i_ = 0;
  double f_ = 0.0;
};

inline std::ostream & operator<<(std::ostream & os, const Number & n)
{
  return os << n.to_string();
}

}  // namespace hcl
