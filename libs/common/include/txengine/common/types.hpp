#pragma once

#include <algorithm>
#include <compare>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace txengine {
namespace common {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;

// Fixed-point monetary value with four fractional digits.
class Amount {
 public:
  static constexpr std::int64_t kScale = 10'000;
  static constexpr int kFractionDigits = 4;

  constexpr Amount() noexcept = default;

  [[nodiscard]] static constexpr Amount from_units(std::int64_t units) noexcept {
    Amount amount;
    amount.units_ = units;
    return amount;
  }

  [[nodiscard]] static constexpr Amount from_whole(std::int64_t whole) noexcept {
    return from_units(whole * kScale);
  }

  // Accepts "12", "12.5", ".5", "12." with an optional leading sign.
  // Digits past the fourth fractional place round half away from zero.
  [[nodiscard]] static std::optional<Amount> parse(std::string_view text) noexcept;

  [[nodiscard]] constexpr std::int64_t units() const noexcept { return units_; }
  [[nodiscard]] constexpr bool is_negative() const noexcept { return units_ < 0; }

  // Shortest form with at least one fractional digit: "25.5", "0.0", "-5.0".
  [[nodiscard]] std::string to_string() const;

  // Arithmetic is checked: leaving the int64 range throws std::overflow_error and
  // leaves the value unchanged.
  constexpr Amount& operator+=(Amount other) {
    std::int64_t result = 0;
    if (__builtin_add_overflow(units_, other.units_, &result)) {
      throw std::overflow_error("amount overflow");
    }
    units_ = result;
    return *this;
  }

  constexpr Amount& operator-=(Amount other) {
    std::int64_t result = 0;
    if (__builtin_sub_overflow(units_, other.units_, &result)) {
      throw std::overflow_error("amount overflow");
    }
    units_ = result;
    return *this;
  }

  friend constexpr Amount operator+(Amount lhs, Amount rhs) { return lhs += rhs; }
  friend constexpr Amount operator-(Amount lhs, Amount rhs) { return lhs -= rhs; }
  friend constexpr auto operator<=>(const Amount&, const Amount&) noexcept = default;
  friend constexpr bool operator==(const Amount&, const Amount&) noexcept = default;

 private:
  std::int64_t units_{0};
};

inline std::optional<Amount> Amount::parse(std::string_view text) noexcept {
  if (text.empty()) {
    return std::nullopt;
  }

  bool negative = false;
  if (text.front() == '-' || text.front() == '+') {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }

  constexpr std::int64_t kMaxWhole = 922'337'203'685'476;  // keeps units within int64
  std::int64_t whole = 0;
  std::int64_t fraction = 0;
  int fraction_digits = 0;
  bool round_up = false;
  bool seen_digit = false;
  bool seen_point = false;

  for (const char c : text) {
    if (c == '.') {
      if (seen_point) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    seen_digit = true;
    const int digit = c - '0';
    if (!seen_point) {
      whole = whole * 10 + digit;
      if (whole > kMaxWhole) {
        return std::nullopt;
      }
    } else if (fraction_digits < kFractionDigits) {
      fraction = fraction * 10 + digit;
      ++fraction_digits;
    } else if (fraction_digits == kFractionDigits) {
      round_up = digit >= 5;
      ++fraction_digits;
    }
  }

  if (!seen_digit) {
    return std::nullopt;
  }

  for (int i = std::min(fraction_digits, kFractionDigits); i < kFractionDigits; ++i) {
    fraction *= 10;
  }

  std::int64_t units = whole * kScale + fraction + (round_up ? 1 : 0);
  return from_units(negative ? -units : units);
}

inline std::string Amount::to_string() const {
  const bool negative = units_ < 0;
  const std::uint64_t magnitude = negative ? static_cast<std::uint64_t>(-(units_ + 1)) + 1
                                           : static_cast<std::uint64_t>(units_);
  const std::uint64_t whole = magnitude / kScale;
  std::uint64_t fraction = magnitude % kScale;

  std::string digits(kFractionDigits, '0');
  for (int i = kFractionDigits - 1; i >= 0; --i) {
    digits[static_cast<std::size_t>(i)] = static_cast<char>('0' + fraction % 10);
    fraction /= 10;
  }
  while (digits.size() > 1 && digits.back() == '0') {
    digits.pop_back();
  }

  std::string out;
  if (negative) {
    out.push_back('-');
  }
  out += std::to_string(whole);
  out.push_back('.');
  out += digits;
  return out;
}

}  // namespace common
}  // namespace txengine
