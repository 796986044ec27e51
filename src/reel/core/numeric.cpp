// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/numeric.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <iterator>
#include <limits>
#include <new>

namespace reel::core {

namespace {

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

} // namespace

std::string keep_digits(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::copy_if(s.begin(), s.end(), std::back_inserter(out), is_digit);
    return out;
}

std::string keep_decimal(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::copy_if(s.begin(), s.end(), std::back_inserter(out),
                 [](char c) { return is_digit(c) || c == '.'; });
    return out;
}

std::expected<std::uint64_t, std::error_code>
parse_unsigned(std::string_view s) noexcept {
    // from_chars rejects a leading '+', but "+4" is still a valid version
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
    }
    if (s.empty() || !is_digit(s.front())) {
        return std::unexpected(make_error_code(ParseErrc::malformed_number));
    }

    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::unexpected(make_error_code(ParseErrc::malformed_number));
    }
    return value;
}

std::expected<std::uint64_t, std::error_code>
parse_digits(std::string_view s) noexcept {
    try {
        return parse_unsigned(keep_digits(s));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(ParseErrc::malformed_number));
    }
}

std::expected<std::chrono::nanoseconds, std::error_code>
parse_decimal_seconds(std::string_view s) noexcept {
    std::string digits;
    try {
        digits = keep_decimal(s);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(ParseErrc::malformed_number));
    }
    if (digits.empty() || digits == ".") {
        return std::unexpected(make_error_code(ParseErrc::malformed_number));
    }

    double seconds = 0.0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds, std::chars_format::fixed);
    if (ec != std::errc{} || ptr != last) {
        return std::unexpected(make_error_code(ParseErrc::malformed_number));
    }

    // Anything above this does not fit a nanosecond count
    constexpr double max_seconds =
        static_cast<double>(std::numeric_limits<std::int64_t>::max()) / 1e9;
    if (!std::isfinite(seconds) || seconds >= max_seconds) {
        return std::unexpected(make_error_code(ParseErrc::malformed_number));
    }

    return std::chrono::nanoseconds{static_cast<std::int64_t>(std::llround(seconds * 1e9))};
}

} // namespace reel::core
