#include "hcl/ast/number.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace hcl
{

namespace
{

constexpr uint64_t k_neg_int_limit = uint64_t{1} << 63;

std::optional<Number> parse_f64(std::string_view text)
{
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return Number::from_f64(value);
}

}  // namespace

std::optional<Number> Number::from_f64(double v) noexcept
{
  if (!std::isfinite(v)) {
    return std::nullopt;
  }
  Number n;
  n.kind_ = Kind::Float;
  n.f_ = v;
  return n;
}

std::optional<Number> Number::parse(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }
  if (text.find_first_of(".eE") != std::string_view::npos) {
    return parse_f64(text);
  }

  uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec == std::errc::result_out_of_range) {
    return parse_f64(text);
  }
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return Number(value);
}

std::optional<uint64_t> Number::as_u64() const noexcept
{
  if (kind_ == Kind::PosInt) {
    return u_;
  }
  return std::nullopt;
}

std::optional<int64_t> Number::as_i64() const noexcept
{
  switch (kind_) {
    case Kind::PosInt:
      if (u_ <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return static_cast<int64_t>(u_);
      }
      return std::nullopt;
    case Kind::NegInt:
      return i_;
    case Kind::Float:
      return std::nullopt;
  }
  return std::nullopt;
}

double Number::as_f64() const noexcept
{
  switch (kind_) {
    case Kind::PosInt:
      return static_cast<double>(u_);
    case Kind::NegInt:
      return static_cast<double>(i_);
    case Kind::Float:
      return f_;
  }
  return f_;
}

Number Number::operator-() const noexcept
{
  switch (kind_) {
    case Kind::PosInt:
      if (u_ == 0) {
        return *this;
      }
      if (u_ <= k_neg_int_limit) {
        return Number(static_cast<int64_t>(uint64_t{0} - u_));
      }
      return *from_f64(-static_cast<double>(u_));
    case Kind::NegInt:
      if (i_ == std::numeric_limits<int64_t>::min()) {
        return Number(k_neg_int_limit);
      }
      return Number(static_cast<uint64_t>(-i_));
    case Kind::Float:
      return *from_f64(-f_);
  }
  return *this;
}

std::string Number::to_string() const
{
  switch (kind_) {
    case Kind::PosInt:
      return fmt::format("{}", u_);
    case Kind::NegInt:
      return fmt::format("{}", i_);
    case Kind::Float: {
      std::string s = fmt::format("{}", f_);
      if (s.find_first_of(".eE") == std::string::npos) {
        s += ".0";
      }
      return s;
    }
  }
  return {};
}

bool Number::operator==(const Number & other) const noexcept
{
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
    case Kind::PosInt:
      return u_ == other.u_;
    case Kind::NegInt:
      return i_ == other.i_;
    case Kind::Float:
      return f_ == other.f_;
  }
  return false;
}

}  // namespace hcl
