// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reel::media {

// One playable chunk, from an #EXTINF tag and the locator line after it
struct Segment {
    std::chrono::nanoseconds duration{0};
    std::string url;                        // Verbatim locator line

    bool operator==(const Segment&) const = default;
};

// Contiguous run of segments between two #EXT-X-DISCONTINUITY tags
struct DiscontinuityGroup {
    std::chrono::milliseconds duration{0};  // Sum of member durations, whole ms
    std::vector<Segment> segments;

    bool operator==(const DiscontinuityGroup&) const = default;
};

// Malformed tag value absorbed by a lenient parse
struct Diagnostic {
    std::size_t line{0};                    // 1-based, the header is line 1
    std::string tag;
    std::string message;

    bool operator==(const Diagnostic&) const = default;
};

// Parsed HLS media playlist. Only PlaylistParser builds one.
class Playlist {
public:
    // True if #EXT-X-ENDLIST was seen
    [[nodiscard]] bool ended() const noexcept { return ended_; }

    // Every segment, in manifest order
    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }

    [[nodiscard]] std::chrono::seconds target_duration() const noexcept { return target_duration_; }

    [[nodiscard]] std::uint64_t version() const noexcept { return version_; }

    // The same segments as segments(), split at discontinuity boundaries
    [[nodiscard]] const std::vector<DiscontinuityGroup>& discontinuities() const noexcept {
        return discontinuities_;
    }

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept { return diagnostics_; }

    // Sum of all group durations
    [[nodiscard]] std::chrono::milliseconds total_duration() const noexcept;

    bool operator==(const Playlist&) const = default;

private:
    friend class PlaylistParser;

    Playlist() = default;

    bool ended_{false};
    std::vector<Segment> segments_;
    std::chrono::seconds target_duration_{0};
    std::uint64_t version_{0};
    std::vector<DiscontinuityGroup> discontinuities_;
    std::vector<Diagnostic> diagnostics_;
};

} // namespace reel::media
