// =============================================================================
// decimal_test.cpp
// =============================================================================
// Unit tests for matchcore::domain::Decimal.
//
// Validates:
//   - Parsing of the wire form (8 fractional digits, no exponent, no rounding)
//   - Canonical toString (no trailing zeros)
//   - Exact arithmetic on values that binary floating point cannot represent
//   - Overflow detection instead of wrap-around
// =============================================================================

#include "matchcore/domain/decimal.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <sstream>
#include <stdexcept>

using matchcore::domain::Decimal;

// -----------------------------------------------------------------------------
// 1. Integer, fractional and signed inputs parse to the expected raw value.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ParsesPlainNumbers) {
  EXPECT_EQ(Decimal::parse("0").raw(), 0);
  EXPECT_EQ(Decimal::parse("1").raw(), Decimal::kMultiplier);
  EXPECT_EQ(Decimal::parse("50000").raw(), 50000 * Decimal::kMultiplier);
  EXPECT_EQ(Decimal::parse("0.5").raw(), Decimal::kMultiplier / 2);
  EXPECT_EQ(Decimal::parse("0.00000001").raw(), 1);
  EXPECT_EQ(Decimal::parse("-2.25").raw(), -225000000);
  EXPECT_EQ(Decimal::parse("+3").raw(), 3 * Decimal::kMultiplier);
  EXPECT_EQ(Decimal::parse(".5"), Decimal::parse("0.5"));
}

// -----------------------------------------------------------------------------
// 2. Anything outside the accepted grammar is rejected, not approximated.
// Why: An amount silently rounded at the ninth digit would let fills drift
//      from what the user submitted.
// -----------------------------------------------------------------------------
TEST(DecimalTest, RejectsMalformedText) {
  EXPECT_FALSE(Decimal::tryParse("").has_value());
  EXPECT_FALSE(Decimal::tryParse("-").has_value());
  EXPECT_FALSE(Decimal::tryParse(".").has_value());
  EXPECT_FALSE(Decimal::tryParse("abc").has_value());
  EXPECT_FALSE(Decimal::tryParse("1e5").has_value());
  EXPECT_FALSE(Decimal::tryParse("1.2.3").has_value());
  EXPECT_FALSE(Decimal::tryParse(" 1").has_value());
  EXPECT_FALSE(Decimal::tryParse("0.000000001").has_value());

  EXPECT_THROW(Decimal::parse("nope"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. Values beyond the int64 range are rejected at parse time.
// -----------------------------------------------------------------------------
TEST(DecimalTest, RejectsOutOfRangeText) {
  // Largest integer part that fits once scaled by 1e8 is 92233720368.
  EXPECT_TRUE(Decimal::tryParse("92233720368").has_value());
  EXPECT_FALSE(Decimal::tryParse("92233720369").has_value());
  EXPECT_FALSE(Decimal::tryParse("100000000000000000000").has_value());
}

// -----------------------------------------------------------------------------
// 4. toString drops trailing zeros and is stable under parse.
// -----------------------------------------------------------------------------
TEST(DecimalTest, CanonicalToString) {
  EXPECT_EQ(Decimal::parse("1.50000000").toString(), "1.5");
  EXPECT_EQ(Decimal::parse("50000").toString(), "50000");
  EXPECT_EQ(Decimal::parse("0.00000001").toString(), "0.00000001");
  EXPECT_EQ(Decimal::parse("-0.1").toString(), "-0.1");
  EXPECT_EQ(Decimal().toString(), "0");

  const Decimal min = Decimal::fromRaw(std::numeric_limits<std::int64_t>::min());
  EXPECT_EQ(min.toString(), "-92233720368.54775808");

  std::ostringstream os;
  os << Decimal::parse("12.340");
  EXPECT_EQ(os.str(), "12.34");
}

// -----------------------------------------------------------------------------
// 5. Decimal arithmetic is exact where double is not.
// Why: Fill accounting compares filled_amount against amount for equality;
//      0.1 + 0.2 must equal 0.3 or a fully filled order would stay open.
// -----------------------------------------------------------------------------
TEST(DecimalTest, ExactAddition) {
  Decimal sum = Decimal::parse("0.1") + Decimal::parse("0.2");
  EXPECT_EQ(sum, Decimal::parse("0.3"));

  Decimal filled;
  for (int i = 0; i < 10; ++i) {
    filled += Decimal::parse("0.1");
  }
  EXPECT_EQ(filled, Decimal::fromUnits(1));
  EXPECT_TRUE((Decimal::fromUnits(1) - filled).isZero());
}

// -----------------------------------------------------------------------------
// 6. Comparison and min/max follow numeric order.
// -----------------------------------------------------------------------------
TEST(DecimalTest, OrderingAndMinMax) {
  const Decimal a = Decimal::parse("49000");
  const Decimal b = Decimal::parse("50000.5");

  EXPECT_LT(a, b);
  EXPECT_GT(b, a);
  EXPECT_LE(a, a);
  EXPECT_NE(a, b);
  EXPECT_EQ(matchcore::domain::min(a, b), a);
  EXPECT_EQ(matchcore::domain::max(a, b), b);

  EXPECT_TRUE(b.isPositive());
  EXPECT_TRUE(Decimal::parse("-1").isNegative());
  EXPECT_TRUE(Decimal::parse("0.0").isZero());
}

// -----------------------------------------------------------------------------
// 7. Overflow throws instead of wrapping.
// Why: A wrapped 24h volume would turn negative and publish garbage stats.
// -----------------------------------------------------------------------------
TEST(DecimalTest, OverflowThrows) {
  Decimal big = Decimal::fromRaw(std::numeric_limits<std::int64_t>::max());
  EXPECT_THROW(big += Decimal::fromRaw(1), std::overflow_error);
  EXPECT_EQ(big.raw(), std::numeric_limits<std::int64_t>::max());

  Decimal small = Decimal::fromRaw(std::numeric_limits<std::int64_t>::min());
  EXPECT_THROW(small -= Decimal::fromRaw(1), std::overflow_error);

  EXPECT_THROW(Decimal::fromUnits(std::numeric_limits<std::int64_t>::max()),
               std::overflow_error);
}
