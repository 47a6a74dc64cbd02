#pragma once

#include <cstdint>
#include <string>

namespace agrovest::domain {

// -----------------------------------------------------------------------------
// Money
// -----------------------------------------------------------------------------
//
// @brief  Fixed-point currency amount stored as signed 64-bit minor units
//         (kobo, two decimal places).
//
// @details
// All arithmetic is integer arithmetic. Values enter the engine either as
// minor units (gateway payloads carry kobo) or as decimal strings parsed by
// parse(); there is no constructor from double.
//
// Thread-safety: Value type. Immutable unless assigned to.
// -----------------------------------------------------------------------------
class Money {
 public:
  static constexpr std::int64_t kMinorPerUnit = 100;

  constexpr Money() = default;

  static constexpr Money fromMinor(std::int64_t minor) { return Money(minor); }
  static constexpr Money fromUnits(std::int64_t units) {
    return Money(units * kMinorPerUnit);
  }

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Parses "185", "185.5", "185.50" or "-35.00".
  //
  // @details
  // At most two fractional digits are accepted; anything else (exponents,
  // separators, a third decimal) throws EngineError(Validation) instead of
  // silently rounding.
  // -------------------------------------------------------------------------
  static Money parse(const std::string& text);

  constexpr std::int64_t minor() const { return minor_; }

  // Always two decimals: "185.00", "-0.50".
  std::string toString() const;

  constexpr bool isZero() const { return minor_ == 0; }
  constexpr bool isNegative() const { return minor_ < 0; }
  constexpr bool isPositive() const { return minor_ > 0; }

  Money& operator+=(Money other);
  Money& operator-=(Money other);

  friend Money operator+(Money a, Money b) { return a += b; }
  friend Money operator-(Money a, Money b) { return a -= b; }

  friend constexpr bool operator==(Money a, Money b) {
    return a.minor_ == b.minor_;
  }
  friend constexpr bool operator!=(Money a, Money b) {
    return a.minor_ != b.minor_;
  }
  friend constexpr bool operator<(Money a, Money b) {
    return a.minor_ < b.minor_;
  }
  friend constexpr bool operator<=(Money a, Money b) {
    return a.minor_ <= b.minor_;
  }
  friend constexpr bool operator>(Money a, Money b) {
    return a.minor_ > b.minor_;
  }
  friend constexpr bool operator>=(Money a, Money b) {
    return a.minor_ >= b.minor_;
  }

 private:
  explicit constexpr Money(std::int64_t minor) : minor_(minor) {}

  std::int64_t minor_{0};
};

// -----------------------------------------------------------------------------
// applyReturnRate(principal, rate_bps)
// -----------------------------------------------------------------------------
// principal * (10000 + rate_bps) / 10000, rounded half away from zero to the
// nearest minor unit. Throws EngineError(Validation) on overflow.
// -----------------------------------------------------------------------------
Money applyReturnRate(Money principal, std::int32_t rate_bps);

}  // namespace agrovest::domain
