#include "core/model/big_key.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

namespace keyspan {
namespace {

bool all_of_digits(std::string_view text, int base) {
  if (text.empty()) {
    return false;
  }
  return std::ranges::all_of(text, [base](unsigned char c) {
    return base == 16 ? std::isxdigit(c) != 0 : std::isdigit(c) != 0;
  });
}

std::optional<mpz_class> parse_digits(std::string_view text, int base) {
  if (!all_of_digits(text, base)) {
    return std::nullopt;
  }
  mpz_class value;
  if (value.set_str(std::string{text}, base) != 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

BigKey::BigKey(std::uint64_t value) : value_(static_cast<unsigned long>(value)) {}

BigKey::BigKey(mpz_class value) : value_(std::move(value)) {}

std::optional<BigKey> BigKey::from_decimal(std::string_view text) {
  auto parsed = parse_digits(text, 10);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  return BigKey{std::move(*parsed)};
}

std::optional<BigKey> BigKey::from_hex(std::string_view text) {
  if (text.starts_with("0x") || text.starts_with("0X")) {
    text.remove_prefix(2);
  }
  auto parsed = parse_digits(text, 16);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  return BigKey{std::move(*parsed)};
}

std::optional<BigKey> BigKey::parse(std::string_view text) {
  if (text.starts_with("0x") || text.starts_with("0X")) {
    return from_hex(text);
  }
  return from_decimal(text);
}

BigKey BigKey::pow2(unsigned exponent) {
  mpz_class value;
  mpz_ui_pow_ui(value.get_mpz_t(), 2U, exponent);
  return BigKey{std::move(value)};
}

BigKey BigKey::saturating_sub(const BigKey& lhs, const BigKey& rhs) {
  if (lhs.value_ <= rhs.value_) {
    return BigKey{};
  }
  return BigKey{mpz_class{lhs.value_ - rhs.value_}};
}

std::string BigKey::to_decimal() const {
  return value_.get_str(10);
}

std::string BigKey::to_hex(std::size_t min_width) const {
  std::string hex = value_.get_str(16);
  std::ranges::transform(hex, hex.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  if (hex.size() < min_width) {
    hex.insert(0, min_width - hex.size(), '0');
  }
  return hex;
}

bool BigKey::is_zero() const {
  return sgn(value_) == 0;
}

bool BigKey::fits_int64() const {
  return mpz_fits_slong_p(value_.get_mpz_t()) != 0;
}

std::int64_t BigKey::to_int64_clamped() const {
  if (!fits_int64()) {
    return std::numeric_limits<std::int64_t>::max();
  }
  return static_cast<std::int64_t>(value_.get_si());
}

BigKey& BigKey::operator+=(const BigKey& rhs) {
  value_ += rhs.value_;
  return *this;
}

BigKey& BigKey::operator*=(const BigKey& rhs) {
  value_ *= rhs.value_;
  return *this;
}

BigKey operator/(const BigKey& lhs, const BigKey& rhs) {
  if (rhs.is_zero()) {
    return BigKey{};
  }
  mpz_class quotient;
  mpz_fdiv_q(quotient.get_mpz_t(), lhs.value_.get_mpz_t(), rhs.value_.get_mpz_t());
  return BigKey{std::move(quotient)};
}

BigKey operator%(const BigKey& lhs, const BigKey& rhs) {
  if (rhs.is_zero()) {
    return BigKey{};
  }
  mpz_class remainder;
  mpz_fdiv_r(remainder.get_mpz_t(), lhs.value_.get_mpz_t(), rhs.value_.get_mpz_t());
  return BigKey{std::move(remainder)};
}

std::int64_t percent_hundredths(const BigKey& part, const BigKey& whole) {
  if (whole.is_zero()) {
    return 0;
  }
  const BigKey scaled = (part * BigKey{10000}) / whole;
  return scaled.to_int64_clamped();
}

std::string format_hundredths(std::int64_t hundredths) {
  const bool negative = hundredths < 0;
  const std::int64_t magnitude = negative ? -hundredths : hundredths;
  std::string out = negative ? "-" : "";
  out += std::to_string(magnitude / 100);
  out.push_back('.');
  const std::int64_t cents = magnitude % 100;
  if (cents < 10) {
    out.push_back('0');
  }
  out += std::to_string(cents);
  return out;
}

}  // namespace keyspan
