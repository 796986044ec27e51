// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/media/playlist_parser.hpp>
#include <reel/core/config.hpp>
#include <spdlog/spdlog.h>
#include <cctype>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace reel::media {

using namespace reel::core;

namespace {

// Where the scanner is between lines
enum class ScanState {
    scanning,           // Dispatching tags
    awaiting_locator    // After #EXTINF, skipping lines until one contains ".ts"
};

// Splits text on '\n' and drops a trailing '\r', so CRLF and LF parse alike.
// A trailing newline does not produce an extra empty line.
class LineCursor {
public:
    explicit LineCursor(std::string_view text) noexcept : rest_(text) {}

    bool next(std::string_view& line) noexcept {
        if (rest_.empty()) {
            return false;
        }

        auto end = rest_.find('\n');
        if (end == std::string_view::npos) {
            line = rest_;
            rest_ = {};
        } else {
            line = rest_.substr(0, end);
            rest_.remove_prefix(end + 1);
        }

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        ++number_;
        return true;
    }

    [[nodiscard]] std::size_t number() const noexcept { return number_; }

private:
    std::string_view rest_;
    std::size_t number_{0};
};

bool contains(std::string_view line, std::string_view needle) noexcept {
    return line.find(needle) != std::string_view::npos;
}

// Text following the first occurrence of `tag`
std::string_view after_tag(std::string_view line, std::string_view tag) noexcept {
    return line.substr(line.find(tag) + tag.size());
}

// Single forward pass over the lines after the header
class Scanner {
public:
    explicit Scanner(const ParseOptions& options) noexcept : options_(options) {}

    std::error_code feed(std::string_view line, std::size_t line_no) {
        line_no_ = line_no;

        if (state_ == ScanState::awaiting_locator) {
            if (contains(line, SEGMENT_LOCATOR_MARKER)) {
                add_segment(line);
                state_ = ScanState::scanning;
            }
            return {};
        }

        if (contains(line, TAG_TARGET_DURATION)) {
            return on_target_duration(line);
        }
        if (contains(line, TAG_VERSION)) {
            return on_version(line);
        }
        if (contains(line, TAG_EXTINF)) {
            return on_extinf(line);
        }
        if (contains(line, TAG_DISCONTINUITY)) {
            at_boundary_ = true;
        } else if (contains(line, TAG_ENDLIST)) {
            ended_ = true;
        }
        return {};
    }

    [[nodiscard]] ScanState state() const noexcept { return state_; }

    bool ended_{false};
    std::vector<Segment> segments_;
    std::chrono::seconds target_duration_{0};
    std::optional<std::uint64_t> version_;
    std::vector<DiscontinuityGroup> discontinuities_;
    std::vector<Diagnostic> diagnostics_;

private:
    std::error_code on_target_duration(std::string_view line) {
        auto delim = line.rfind(TARGET_DURATION_DELIMITER);
        auto payload = delim == std::string_view::npos ? line : line.substr(delim + 1);

        auto value = parse_digits(payload);
        if (value && *value > static_cast<std::uint64_t>(std::numeric_limits<std::chrono::seconds::rep>::max())) {
            value = std::unexpected(make_error_code(ParseErrc::malformed_number));
        }
        if (!value) {
            return absorb(value.error(), TAG_TARGET_DURATION,
                          "expecting digits after the target duration tag");
        }
        target_duration_ = std::chrono::seconds{static_cast<std::chrono::seconds::rep>(*value)};
        return {};
    }

    std::error_code on_version(std::string_view line) {
        auto value = parse_unsigned(after_tag(line, TAG_VERSION));
        if (!value) {
            version_.reset();
            return absorb(value.error(), TAG_VERSION, "expecting an unsigned version number");
        }
        version_ = *value;
        return {};
    }

    std::error_code on_extinf(std::string_view line) {
        auto payload = after_tag(line, TAG_EXTINF);
        payload = payload.substr(0, payload.find(EXTINF_TITLE_DELIMITER));

        // The locator wait starts even if the duration is bad
        state_ = ScanState::awaiting_locator;

        auto value = parse_decimal_seconds(payload);
        if (!value) {
            return absorb(value.error(), TAG_EXTINF, "expecting a decimal duration in seconds");
        }
        pending_duration_ = *value;
        return {};
    }

    void add_segment(std::string_view line) {
        Segment segment{pending_duration_, std::string(line)};
        segments_.push_back(segment);

        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(segment.duration);
        if (at_boundary_ || discontinuities_.empty()) {
            spdlog::debug("line {}: discontinuity group {} starts at {}",
                          line_no_, discontinuities_.size(), segment.url);
            discontinuities_.push_back(DiscontinuityGroup{millis, {std::move(segment)}});
            at_boundary_ = false;
        } else {
            auto& group = discontinuities_.back();
            group.duration += millis;
            group.segments.push_back(std::move(segment));
        }
    }

    // Lenient mode keeps the previous value and records what was dropped
    std::error_code absorb(std::error_code ec, std::string_view tag, std::string message) {
        if (options_.numeric_policy == NumericPolicy::strict) {
            spdlog::debug("line {}: {}: {}", line_no_, tag, message);
            return ec;
        }

        spdlog::warn("line {}: {}: {}", line_no_, tag, message);
        diagnostics_.push_back(Diagnostic{line_no_, std::string(tag), std::move(message)});
        return {};
    }

    const ParseOptions& options_;
    ScanState state_{ScanState::scanning};
    std::chrono::nanoseconds pending_duration_{0};
    bool at_boundary_{true};
    std::size_t line_no_{0};
};

} // namespace

bool PlaylistParser::is_playlist_path(std::string_view path) noexcept {
    std::string lower_path;
    lower_path.reserve(path.size());
    for (char c : path) {
        lower_path += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    // Ignore any query string
    auto query = lower_path.find('?');
    if (query != std::string::npos) {
        lower_path.resize(query);
    }

    return lower_path.ends_with(".m3u8") || lower_path.ends_with(".m3u");
}

std::expected<Playlist, std::error_code>
PlaylistParser::parse(std::string_view text, const ParseOptions& options) noexcept {
    LineCursor cursor(text);

    std::string_view line;
    if (!cursor.next(line) || line != HEADER_MARKER) {
        return std::unexpected(make_error_code(ParseErrc::missing_header));
    }

    Scanner scanner(options);
    while (cursor.next(line)) {
        if (auto ec = scanner.feed(line, cursor.number())) {
            return std::unexpected(ec);
        }
    }

    if (scanner.state() == ScanState::awaiting_locator) {
        spdlog::debug("playlist ends before the locator of its last #EXTINF");
    }

    if (!scanner.version_) {
        return std::unexpected(make_error_code(ParseErrc::missing_version));
    }

    Playlist playlist;
    playlist.ended_ = scanner.ended_;
    playlist.segments_ = std::move(scanner.segments_);
    playlist.target_duration_ = scanner.target_duration_;
    playlist.version_ = *scanner.version_;
    playlist.discontinuities_ = std::move(scanner.discontinuities_);
    playlist.diagnostics_ = std::move(scanner.diagnostics_);

    spdlog::debug("parsed playlist: version {}, {} segments in {} groups, {} diagnostics",
                  playlist.version_, playlist.segments_.size(),
                  playlist.discontinuities_.size(), playlist.diagnostics_.size());
    return playlist;
}

} // namespace reel::media
