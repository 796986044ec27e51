// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace reel::core {

// How malformed numeric tag payloads are handled
enum class NumericPolicy {
    lenient,    // Keep the previous value and record a diagnostic
    strict      // Fail the parse with ParseErrc::malformed_number
};

// Characters of `s` that are ASCII digits, in order
[[nodiscard]] std::string keep_digits(std::string_view s);

// Characters of `s` that are ASCII digits or '.', in order
[[nodiscard]] std::string keep_decimal(std::string_view s);

// Whole-string unsigned integer parse. No sign, no whitespace.
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
parse_unsigned(std::string_view s) noexcept;

// keep_digits() followed by parse_unsigned(). "20 (s)" -> 20
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
parse_digits(std::string_view s) noexcept;

// keep_decimal() followed by a decimal parse, rounded to the nearest nanosecond.
// "12.166" -> 12'166'000'000ns
[[nodiscard]] std::expected<std::chrono::nanoseconds, std::error_code>
parse_decimal_seconds(std::string_view s) noexcept;

} // namespace reel::core
