#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <gmpxx.h>

namespace keyspan {

// Unsigned arbitrary-precision key value. Every keyspace bound, width and
// counter flows through this type; none of them is ever widened to a double.
class BigKey {
public:
  BigKey() = default;
  explicit BigKey(std::uint64_t value);

  static std::optional<BigKey> from_decimal(std::string_view text);
  static std::optional<BigKey> from_hex(std::string_view text);
  // "0x"-prefixed text is hex, anything else decimal.
  static std::optional<BigKey> parse(std::string_view text);
  static BigKey pow2(unsigned exponent);
  static BigKey saturating_sub(const BigKey& lhs, const BigKey& rhs);

  [[nodiscard]] std::string to_decimal() const;
  [[nodiscard]] std::string to_hex(std::size_t min_width = 0) const;
  [[nodiscard]] bool is_zero() const;
  [[nodiscard]] bool fits_int64() const;
  [[nodiscard]] std::int64_t to_int64_clamped() const;

  BigKey& operator+=(const BigKey& rhs);
  BigKey& operator*=(const BigKey& rhs);

  friend BigKey operator+(BigKey lhs, const BigKey& rhs) { return lhs += rhs; }
  friend BigKey operator*(BigKey lhs, const BigKey& rhs) { return lhs *= rhs; }
  // Floor division; division by zero yields zero.
  friend BigKey operator/(const BigKey& lhs, const BigKey& rhs);
  friend BigKey operator%(const BigKey& lhs, const BigKey& rhs);

  friend bool operator==(const BigKey& lhs, const BigKey& rhs) { return cmp(lhs.value_, rhs.value_) == 0; }
  friend bool operator!=(const BigKey& lhs, const BigKey& rhs) { return !(lhs == rhs); }
  friend bool operator<(const BigKey& lhs, const BigKey& rhs) { return cmp(lhs.value_, rhs.value_) < 0; }
  friend bool operator>(const BigKey& lhs, const BigKey& rhs) { return rhs < lhs; }
  friend bool operator<=(const BigKey& lhs, const BigKey& rhs) { return !(rhs < lhs); }
  friend bool operator>=(const BigKey& lhs, const BigKey& rhs) { return !(lhs < rhs); }

private:
  explicit BigKey(mpz_class value);

  mpz_class value_{0};
};

// floor(part * 10000 / whole); zero when whole is zero.
std::int64_t percent_hundredths(const BigKey& part, const BigKey& whole);
std::string format_hundredths(std::int64_t hundredths);

}  // namespace keyspan
