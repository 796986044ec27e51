// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/playlist.hpp>
#include <numeric>

namespace reel::media {

std::chrono::milliseconds Playlist::total_duration() const noexcept {
    return std::accumulate(discontinuities_.begin(), discontinuities_.end(),
                           std::chrono::milliseconds{0},
                           [](std::chrono::milliseconds sum, const DiscontinuityGroup& group) {
                               return sum + group.duration;
                           });
}

} // namespace reel::media
