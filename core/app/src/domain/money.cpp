#include "agrovest/domain/money.hpp"

#include "agrovest/errors/engine_error.hpp"

#include <cstdlib>
#include <limits>

namespace agrovest::domain {

namespace {

constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
constexpr std::int64_t kBpsScale = 10000;

[[noreturn]] void throwOverflow() {
  throw EngineError(ErrorCode::Validation, "Amount out of range");
}

std::int64_t checkedAdd(std::int64_t a, std::int64_t b) {
  if ((b > 0 && a > kMax - b) || (b < 0 && a < kMin - b)) {
    throwOverflow();
  }
  return a + b;
}

}  // namespace

// -----------------------------------------------------------------------------
// parse(): strict decimal grammar  -?digits(.d{1,2})?
// -----------------------------------------------------------------------------
Money Money::parse(const std::string& text) {
  const std::string invalid = "Invalid amount: '" + text + "'";
  if (text.empty()) {
    throw EngineError(ErrorCode::Validation, invalid);
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[pos] == '-') {
    negative = true;
    ++pos;
  }

  std::int64_t whole = 0;
  std::size_t whole_digits = 0;
  while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
    const std::int64_t digit = text[pos] - '0';
    if (whole > (kMax / kMinorPerUnit - digit) / 10) {
      throwOverflow();
    }
    whole = whole * 10 + digit;
    ++whole_digits;
    ++pos;
  }
  if (whole_digits == 0) {
    throw EngineError(ErrorCode::Validation, invalid);
  }

  std::int64_t fraction = 0;
  if (pos < text.size()) {
    if (text[pos] != '.') {
      throw EngineError(ErrorCode::Validation, invalid);
    }
    ++pos;
    std::size_t fraction_digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (fraction_digits == 2) {
        throw EngineError(ErrorCode::Validation,
                          invalid + " (more than two decimals)");
      }
      fraction = fraction * 10 + (text[pos] - '0');
      ++fraction_digits;
      ++pos;
    }
    if (fraction_digits == 0 || pos != text.size()) {
      throw EngineError(ErrorCode::Validation, invalid);
    }
    if (fraction_digits == 1) {
      fraction *= 10;
    }
  }

  if (whole > (kMax - fraction) / kMinorPerUnit) {
    throwOverflow();
  }
  const std::int64_t minor = whole * kMinorPerUnit + fraction;
  return Money(negative ? -minor : minor);
}

std::string Money::toString() const {
  // Work on the magnitude in unsigned space so kMin does not overflow.
  const bool negative = minor_ < 0;
  const std::uint64_t magnitude =
      negative ? static_cast<std::uint64_t>(-(minor_ + 1)) + 1
               : static_cast<std::uint64_t>(minor_);
  const std::uint64_t whole = magnitude / kMinorPerUnit;
  const std::uint64_t cents = magnitude % kMinorPerUnit;

  std::string out = negative ? "-" : "";
  out += std::to_string(whole);
  out += '.';
  if (cents < 10) {
    out += '0';
  }
  out += std::to_string(cents);
  return out;
}

Money& Money::operator+=(Money other) {
  minor_ = checkedAdd(minor_, other.minor_);
  return *this;
}

Money& Money::operator-=(Money other) {
  if (other.minor_ == kMin) {
    throwOverflow();
  }
  minor_ = checkedAdd(minor_, -other.minor_);
  return *this;
}

// -----------------------------------------------------------------------------
// applyReturnRate()
// -----------------------------------------------------------------------------
Money applyReturnRate(Money principal, std::int32_t rate_bps) {
  const std::int64_t factor = kBpsScale + rate_bps;
  if (factor < 0) {
    throw EngineError(ErrorCode::Validation, "Return rate below -100%");
  }
  const std::int64_t p = principal.minor();
  if (factor != 0 && std::llabs(p) > kMax / factor) {
    throwOverflow();
  }

  const std::int64_t scaled = p * factor;
  std::int64_t quotient = scaled / kBpsScale;
  const std::int64_t remainder = scaled % kBpsScale;
  if (std::llabs(remainder) * 2 >= kBpsScale) {
    quotient += (scaled < 0) ? -1 : 1;
  }
  return Money::fromMinor(quotient);
}

}  // namespace agrovest::domain
