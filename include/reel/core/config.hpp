// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

namespace reel::core {

// Mandatory first line
constexpr std::string_view HEADER_MARKER = "#EXTM3U";

// Tag literals, matched as case-sensitive substrings in this order
constexpr std::string_view TAG_TARGET_DURATION = "EXT-X-TARGETDURATION";
constexpr std::string_view TAG_VERSION = "#EXT-X-VERSION:";
constexpr std::string_view TAG_EXTINF = "#EXTINF:";
constexpr std::string_view TAG_DISCONTINUITY = "#EXT-X-DISCONTINUITY";
constexpr std::string_view TAG_ENDLIST = "#EXT-X-ENDLIST";

// A line is a segment locator only if it contains this
constexpr std::string_view SEGMENT_LOCATOR_MARKER = ".ts";

constexpr char TARGET_DURATION_DELIMITER = ':';
constexpr char EXTINF_TITLE_DELIMITER = ',';

} // namespace reel::core
