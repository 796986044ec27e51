// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/playlist_json.hpp>

namespace reel::media {

namespace {

double to_seconds(std::chrono::nanoseconds d) noexcept {
    return std::chrono::duration<double>(d).count();
}

} // namespace

void to_json(nlohmann::json& j, const Segment& segment) {
    j = nlohmann::json{
        {"duration", to_seconds(segment.duration)},
        {"url", segment.url},
    };
}

void to_json(nlohmann::json& j, const DiscontinuityGroup& group) {
    j = nlohmann::json{
        {"duration_ms", group.duration.count()},
        {"segments", group.segments},
    };
}

void to_json(nlohmann::json& j, const Diagnostic& diagnostic) {
    j = nlohmann::json{
        {"line", diagnostic.line},
        {"tag", diagnostic.tag},
        {"message", diagnostic.message},
    };
}

void to_json(nlohmann::json& j, const Playlist& playlist) {
    j = nlohmann::json{
        {"version", playlist.version()},
        {"target_duration", playlist.target_duration().count()},
        {"ended", playlist.ended()},
        {"total_duration_ms", playlist.total_duration().count()},
        {"segments", playlist.segments()},
        {"discontinuities", playlist.discontinuities()},
    };
    if (!playlist.diagnostics().empty()) {
        j["diagnostics"] = playlist.diagnostics();
    }
}

} // namespace reel::media
