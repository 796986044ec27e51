// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/media/playlist.hpp>
#include <nlohmann/json.hpp>

namespace reel::media {

// JSON views for the CLI. Segment durations are seconds (double),
// group and total durations are integer milliseconds.
void to_json(nlohmann::json& j, const Segment& segment);
void to_json(nlohmann::json& j, const DiscontinuityGroup& group);
void to_json(nlohmann::json& j, const Diagnostic& diagnostic);
void to_json(nlohmann::json& j, const Playlist& playlist);

} // namespace reel::media
