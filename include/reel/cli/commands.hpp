// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/media/playlist.hpp>
#include <expected>
#include <iosfwd>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace reel::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Name of the stderr logger installed by configure_logging()
constexpr std::string_view LOGGER_NAME = "reel";

// Command line arguments
struct CliArgs {
    std::vector<std::string> paths;     // "-" reads stdin
    bool json{false};
    bool strict{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Route spdlog to stderr and set its level from --verbose / --quiet
void configure_logging(const CliArgs& args) noexcept;

// Read a whole playlist file, or stdin for "-"
[[nodiscard]] std::expected<std::string, std::error_code>
load_text(const std::string& path) noexcept;

// Parse one playlist and print it to `out`
[[nodiscard]] CliResult show(const std::string& path, const CliArgs& args, std::ostream& out) noexcept;

// Show every path in `args`. Returns 0 only if all of them parsed;
// each failure is reported to `err` as "Error: <path>: <message>".
[[nodiscard]] int run(const CliArgs& args, std::ostream& out, std::ostream& err) noexcept;

// Human-readable summary of a parsed playlist
void print_summary(const media::Playlist& playlist, std::ostream& out);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace reel::cli
