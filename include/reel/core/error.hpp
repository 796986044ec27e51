// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace reel::core {

enum class ParseErrc {
    success = 0,
    missing_header,
    missing_version,
    malformed_number,
    read_failed,
};

namespace detail {

struct ParseErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reel::parse";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<ParseErrc>(ev)) {
            case ParseErrc::success:          return "Success";
            case ParseErrc::missing_header:   return "Missing #EXTM3U header";
            case ParseErrc::missing_version:  return "Missing #EXT-X-VERSION";
            case ParseErrc::malformed_number: return "Malformed numeric tag value";
            case ParseErrc::read_failed:      return "Unable to read playlist";
            default:                          return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ParseErrcCategory& parse_errc_category() noexcept {
    static detail::ParseErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ParseErrc e) noexcept {
    return {static_cast<int>(e), parse_errc_category()};
}

} // namespace reel::core

namespace std {

template<>
struct is_error_code_enum<reel::core::ParseErrc> : true_type {};

} // namespace std
