#include "matchcore/domain/decimal.hpp"

#include <limits>
#include <stdexcept>

namespace matchcore {
namespace domain {

namespace {

constexpr std::int64_t kMaxRaw = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMinRaw = std::numeric_limits<std::int64_t>::min();

bool isDigit(char c) { return c >= '0' && c <= '9'; }

}  // namespace

// -----------------------------------------------------------------------------
// fromUnits
// -----------------------------------------------------------------------------
Decimal Decimal::fromUnits(std::int64_t units) {
  if (units > kMaxRaw / kMultiplier || units < kMinRaw / kMultiplier) {
    throw std::overflow_error("Decimal::fromUnits: value out of range");
  }
  return fromRaw(units * kMultiplier);
}

// -----------------------------------------------------------------------------
// tryParse: hand-rolled so that no step goes through a double
// -----------------------------------------------------------------------------
std::optional<Decimal> Decimal::tryParse(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[0] == '+' || text[0] == '-') {
    negative = (text[0] == '-');
    ++pos;
  }

  bool any_digit = false;

  // Integer part. Bail out as soon as it cannot fit once scaled, which also
  // keeps int_part itself far away from uint64 overflow.
  std::uint64_t int_part = 0;
  while (pos < text.size() && isDigit(text[pos])) {
    int_part = int_part * 10 + static_cast<std::uint64_t>(text[pos] - '0');
    if (int_part > static_cast<std::uint64_t>(kMaxRaw / kMultiplier)) {
      return std::nullopt;
    }
    any_digit = true;
    ++pos;
  }

  // Fractional part: at most kScale digits, never rounded.
  std::uint64_t frac = 0;
  int frac_digits = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && isDigit(text[pos])) {
      if (frac_digits == kScale) {
        return std::nullopt;
      }
      frac = frac * 10 + static_cast<std::uint64_t>(text[pos] - '0');
      ++frac_digits;
      any_digit = true;
      ++pos;
    }
  }

  if (pos != text.size() || !any_digit) {
    return std::nullopt;
  }

  for (int i = frac_digits; i < kScale; ++i) {
    frac *= 10;
  }

  const auto max_raw = static_cast<std::uint64_t>(kMaxRaw);
  const auto multiplier = static_cast<std::uint64_t>(kMultiplier);
  if (int_part > (max_raw - frac) / multiplier) {
    return std::nullopt;
  }

  const auto magnitude =
      static_cast<std::int64_t>(int_part * multiplier + frac);
  return fromRaw(negative ? -magnitude : magnitude);
}

// -----------------------------------------------------------------------------
// parse: throwing wrapper around tryParse
// -----------------------------------------------------------------------------
Decimal Decimal::parse(std::string_view text) {
  auto value = tryParse(text);
  if (!value) {
    throw std::invalid_argument("invalid decimal: '" + std::string(text) +
                                "'");
  }
  return *value;
}

// -----------------------------------------------------------------------------
// toString: shortest canonical form, trailing fractional zeros dropped
// -----------------------------------------------------------------------------
std::string Decimal::toString() const {
  // Negating INT64_MIN is undefined, so compute the magnitude in unsigned
  // arithmetic.
  const std::uint64_t magnitude =
      raw_ < 0 ? static_cast<std::uint64_t>(-(raw_ + 1)) + 1
               : static_cast<std::uint64_t>(raw_);
  const auto multiplier = static_cast<std::uint64_t>(kMultiplier);

  std::string out;
  if (raw_ < 0) {
    out.push_back('-');
  }
  out += std::to_string(magnitude / multiplier);

  const std::uint64_t frac = magnitude % multiplier;
  if (frac != 0) {
    std::string digits = std::to_string(frac);
    digits.insert(0, static_cast<std::size_t>(kScale) - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') {
      digits.pop_back();
    }
    out.push_back('.');
    out += digits;
  }
  return out;
}

// -----------------------------------------------------------------------------
// Checked arithmetic
// -----------------------------------------------------------------------------
Decimal& Decimal::operator+=(const Decimal& other) {
  if ((other.raw_ > 0 && raw_ > kMaxRaw - other.raw_) ||
      (other.raw_ < 0 && raw_ < kMinRaw - other.raw_)) {
    throw std::overflow_error("Decimal addition overflow");
  }
  raw_ += other.raw_;
  return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
  if ((other.raw_ > 0 && raw_ < kMinRaw + other.raw_) ||
      (other.raw_ < 0 && raw_ > kMaxRaw + other.raw_)) {
    throw std::overflow_error("Decimal subtraction overflow");
  }
  raw_ -= other.raw_;
  return *this;
}

std::ostream& operator<<(std::ostream& os, const Decimal& value) {
  return os << value.toString();
}

}  // namespace domain
}  // namespace matchcore
