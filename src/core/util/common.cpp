#include "core/util/common.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iterator>
#include <random>
#include <system_error>

#ifdef KEYSPAN_HAVE_SODIUM
#include <sodium.h>
#endif

namespace keyspan::util {
namespace {

std::string to_hex(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2U);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4U) & 0x0FU]);
    out.push_back(kHex[c & 0x0FU]);
  }
  return out;
}

std::string random_bytes_raw(std::size_t bytes) {
  std::string raw;
  raw.resize(bytes);
#ifdef KEYSPAN_HAVE_SODIUM
  if (sodium_init() >= 0) {
    randombytes_buf(raw.data(), raw.size());
    return raw;
  }
#endif
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::uniform_int_distribution<unsigned int> dist(0, 255);
  for (std::size_t i = 0; i < bytes; ++i) {
    raw[i] = static_cast<char>(dist(gen));
  }
  return raw;
}

}  // namespace

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string format_unix_utc(std::int64_t unix_ts) {
  const std::time_t t = static_cast<std::time_t>(unix_ts);
  std::tm tm{};
  if (gmtime_r(&t, &tm) == nullptr) {
    return std::to_string(unix_ts);
  }
  char buffer[32] = {};
  const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
  if (written == 0) {
    return std::to_string(unix_ts);
  }
  return std::string(buffer, written);
}

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::optional<double> parse_double(std::string_view text) {
  const std::string trimmed = trim_copy(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  double value = 0.0;
  const auto result = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
  if (result.ec != std::errc() || result.ptr != trimmed.data() + trimmed.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::int64_t> parse_int64(std::string_view text) {
  std::int64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> parse_boolish(std::string_view value) {
  const std::string lowered = lowercase_copy(trim_copy(value));
  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "found") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "exhausted") {
    return false;
  }
  return std::nullopt;
}

std::string random_hex(std::size_t bytes) {
  return to_hex(random_bytes_raw(bytes));
}

std::string join(const std::vector<std::string>& values, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(values[i]);
  }
  return out;
}

}  // namespace keyspan::util
