#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyspan::util {

std::int64_t unix_timestamp_now();
std::string format_unix_utc(std::int64_t unix_ts);

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::optional<double> parse_double(std::string_view text);
std::optional<std::int64_t> parse_int64(std::string_view text);
// Accepts 1/true/yes/found and 0/false/no/exhausted; anything else is nullopt.
std::optional<bool> parse_boolish(std::string_view value);

std::string random_hex(std::size_t bytes);

std::string join(const std::vector<std::string>& values, std::string_view separator);

}  // namespace keyspan::util
