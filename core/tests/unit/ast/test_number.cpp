#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>

#include "hcl/ast/number.hpp"

using hcl::Number;

// ============================================================================
// Construction
// ============================================================================

TEST(AstNumber, NonNegativeIntegersAreUnsigned)
{
  const Number from_signed(int64_t{5});
  const Number from_unsigned(uint64_t{5});
  EXPECT_EQ(from_signed.kind(), Number::Kind::PosInt);
  EXPECT_EQ(from_signed, from_unsigned);
  EXPECT_EQ(Number(0).kind(), Number::Kind::PosInt);
}

TEST(AstNumber, NegativeIntegers)
{
  const Number n(-3);
  EXPECT_EQ(n.kind(), Number::Kind::NegInt);
  EXPECT_TRUE(n.is_i64());
  EXPECT_FALSE(n.is_u64());
  EXPECT_EQ(n.as_i64(), -3);
  EXPECT_FALSE(n.as_u64().has_value());
  EXPECT_DOUBLE_EQ(n.as_f64(), -3.0);
}

TEST(AstNumber, LargeUnsignedIsNotI64)
{
  const Number n(std::numeric_limits<uint64_t>::max());
  EXPECT_TRUE(n.is_u64());
  EXPECT_FALSE(n.is_i64());
  EXPECT_FALSE(n.as_i64().has_value());
}

TEST(AstNumber, FloatsRejectNonFinite)
{
  EXPECT_FALSE(Number::from_f64(std::numeric_limits<double>::infinity()).has_value());
  EXPECT_FALSE(Number::from_f64(std::nan("")).has_value());
  ASSERT_TRUE(Number::from_f64(2.5).has_value());
  EXPECT_TRUE(Number::from_f64(2.5)->is_f64());
}

TEST(AstNumber, IntegersAndFloatsNeverCompareEqual)
{
  EXPECT_NE(Number(1), *Number::from_f64(1.0));
}

// ============================================================================
// Parsing
// ============================================================================

TEST(AstNumber, ParseIntegers)
{
  EXPECT_EQ(Number::parse("0"), Number(0));
  EXPECT_EQ(Number::parse("12345"), Number(12345));
  EXPECT_EQ(Number::parse("18446744073709551615"), Number(std::numeric_limits<uint64_t>::max()));
}

TEST(AstNumber, ParseOverflowBecomesFloat)
{
  const auto n = Number::parse("18446744073709551616");
  ASSERT_TRUE(n.has_value());
  EXPECT_TRUE(n->is_f64());
}

TEST(AstNumber, ParseFloats)
{
  EXPECT_EQ(Number::parse("1.5"), Number::from_f64(1.5));
  EXPECT_EQ(Number::parse("2e3"), Number::from_f64(2000.0));
  EXPECT_EQ(Number::parse("2.0"), Number::from_f64(2.0));
}

TEST(AstNumber, ParseRejectsNonFiniteAndGarbage)
{
  EXPECT_FALSE(Number::parse("1e999").has_value());
  EXPECT_FALSE(Number::parse("").has_value());
  EXPECT_FALSE(Number::parse("12a").has_value());
}

// ============================================================================
// Negation and text
// ============================================================================

TEST(AstNumber, Negation)
{
  EXPECT_EQ(-Number(5), Number(-5));
  EXPECT_EQ(-Number(-5), Number(5));
  EXPECT_EQ(-Number(0), Number(0));
  EXPECT_EQ(-*Number::from_f64(1.5), Number::from_f64(-1.5));
}

TEST(AstNumber, NegationAtIntegerLimits)
{
  const Number min_i64(std::numeric_limits<int64_t>::min());
  EXPECT_EQ(-Number(uint64_t{1} << 63), min_i64);
  EXPECT_EQ(-min_i64, Number(uint64_t{1} << 63));
  EXPECT_TRUE((-Number(std::numeric_limits<uint64_t>::max())).is_f64());
}

TEST(AstNumber, ToString)
{
  EXPECT_EQ(Number(42).to_string(), "42");
  EXPECT_EQ(Number(-42).to_string(), "-42");
  EXPECT_EQ(Number::from_f64(3.0)->to_string(), "3.0");
  EXPECT_EQ(Number::from_f64(-0.125)->to_string(), "-0.125");
}

TEST(AstNumber, ToStringParsesBack)
{
  for (const double v : {0.1, 1e-7, 123456.789, 1e21}) {
    const Number n = *Number::from_f64(v);
    EXPECT_EQ(Number::parse(n.to_string()), n) << n.to_string();
  }
}
