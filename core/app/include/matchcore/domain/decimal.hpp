#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace matchcore {
namespace domain {

// -----------------------------------------------------------------------------
// Decimal: exact fixed-point number for prices and amounts
// -----------------------------------------------------------------------------
//
// @brief  Signed decimal with exactly kScale (8) fractional digits, stored as
//         a scaled 64-bit integer (value * 10^8).
//
// @details
// Every price and amount in the engine is a Decimal. Binary floating point
// cannot represent 0.1 exactly, so repeated partial fills of an order like
// 0.3 = 0.1 + 0.1 + 0.1 would drift and the filled == amount comparison that
// drives the order state machine would fail. With a scaled integer, addition,
// subtraction, min and comparison are exact.
//
// Range:
//   raw values span int64_t, i.e. roughly +/-92,233,720,368.54775807.
//   parse() rejects text outside that range and text with more than 8
//   fractional digits (no silent rounding). Addition and subtraction throw
//   std::overflow_error instead of wrapping.
//
// Text form:
//   toString() produces the shortest canonical text ("100", "0.5",
//   "-2.125"). This is the form used on the wire (JSON codec, journal,
//   notifications), so precision is never lost in transit.
//
// Thread model:
//   Value type, no shared state. Safe to copy between threads.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  static constexpr int kScale = 8;
  static constexpr std::int64_t kMultiplier = 100000000LL;  // 10^kScale

  constexpr Decimal() = default;

  // Wraps an already-scaled integer (raw = value * 10^8).
  static constexpr Decimal fromRaw(std::int64_t raw) {
    Decimal d;
    d.raw_ = raw;
    return d;
  }

  // Whole units, e.g. fromUnits(100) == "100". Throws std::overflow_error
  // when units * 10^8 does not fit.
  static Decimal fromUnits(std::int64_t units);

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Parses "[+-]digits[.digits]" into a Decimal.
  //
  // @throws std::invalid_argument  on malformed text, more than kScale
  //                                fractional digits, or out-of-range values.
  // -------------------------------------------------------------------------
  static Decimal parse(std::string_view text);

  // Non-throwing variant of parse(). Returns std::nullopt on any error.
  static std::optional<Decimal> tryParse(std::string_view text);

  constexpr std::int64_t raw() const { return raw_; }
  constexpr bool isZero() const { return raw_ == 0; }
  constexpr bool isPositive() const { return raw_ > 0; }
  constexpr bool isNegative() const { return raw_ < 0; }

  std::string toString() const;

  Decimal& operator+=(const Decimal& other);
  Decimal& operator-=(const Decimal& other);

  friend Decimal operator+(Decimal lhs, const Decimal& rhs) {
    lhs += rhs;
    return lhs;
  }
  friend Decimal operator-(Decimal lhs, const Decimal& rhs) {
    lhs -= rhs;
    return lhs;
  }

  friend constexpr bool operator==(const Decimal& a, const Decimal& b) {
    return a.raw_ == b.raw_;
  }
  friend constexpr bool operator!=(const Decimal& a, const Decimal& b) {
    return a.raw_ != b.raw_;
  }
  friend constexpr bool operator<(const Decimal& a, const Decimal& b) {
    return a.raw_ < b.raw_;
  }
  friend constexpr bool operator<=(const Decimal& a, const Decimal& b) {
    return a.raw_ <= b.raw_;
  }
  friend constexpr bool operator>(const Decimal& a, const Decimal& b) {
    return a.raw_ > b.raw_;
  }
  friend constexpr bool operator>=(const Decimal& a, const Decimal& b) {
    return a.raw_ >= b.raw_;
  }

 private:
  std::int64_t raw_{0};
};

inline Decimal min(const Decimal& a, const Decimal& b) { return b < a ? b : a; }
inline Decimal max(const Decimal& a, const Decimal& b) { return a < b ? b : a; }

// Streams the canonical text form (used by log lines and gtest messages).
std::ostream& operator<<(std::ostream& os, const Decimal& value);

}  // namespace domain
}  // namespace matchcore
