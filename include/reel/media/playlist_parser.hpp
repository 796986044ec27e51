// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/error.hpp>
#include <reel/core/numeric.hpp>
#include <reel/media/playlist.hpp>
#include <expected>
#include <string_view>

namespace reel::media {

struct ParseOptions {
    core::NumericPolicy numeric_policy{core::NumericPolicy::lenient};
};

// HLS media playlist (ext-m3u) parser
class PlaylistParser {
public:
    // Parse already-loaded playlist text.
    // Fails with ParseErrc::missing_header if the first line is not #EXTM3U,
    // ParseErrc::missing_version if no #EXT-X-VERSION value parsed, and in
    // strict mode ParseErrc::malformed_number on the first bad numeric value.
    [[nodiscard]] static std::expected<Playlist, std::error_code>
    parse(std::string_view text, const ParseOptions& options = {}) noexcept;

    // Check if a path or URL names an m3u8 playlist
    [[nodiscard]] static bool is_playlist_path(std::string_view path) noexcept;
};

} // namespace reel::media
