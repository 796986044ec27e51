// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <reel/core/error.hpp>
#include <reel/media/playlist_json.hpp>
#include <reel/media/playlist_parser.hpp>
#include <reel/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace reel::core;
using namespace reel::media;

namespace reel::cli {

namespace {

double seconds_of(std::chrono::milliseconds d) noexcept {
    return std::chrono::duration<double>(d).count();
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-j" || arg == "--json") {
            args.json = true;
        } else if (arg == "-s" || arg == "--strict") {
            args.strict = true;
        } else if (arg == "-" || !arg.starts_with("-")) {
            // Playlist path (no option)
            args.paths.push_back(arg);
        }
    }

    return args;
}

void configure_logging(const CliArgs& args) noexcept {
    // Logs go to stderr so stdout only carries the playlist output
    try {
        auto logger = spdlog::get(std::string(LOGGER_NAME));
        if (!logger) {
            logger = spdlog::stderr_color_mt(std::string(LOGGER_NAME));
        }
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Warning: logging setup failed: " << e.what() << std::endl;
    }

    if (args.quiet) {
        spdlog::set_level(spdlog::level::off);
    } else if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

//=============================================================================
// Commands
//=============================================================================

std::expected<std::string, std::error_code> load_text(const std::string& path) noexcept {
    try {
        std::ostringstream buffer;
        if (path == "-") {
            buffer << std::cin.rdbuf();
        } else {
            std::ifstream file(path, std::ios::binary);
            if (!file) {
                return std::unexpected(make_error_code(ParseErrc::read_failed));
            }
            buffer << file.rdbuf();
        }
        return buffer.str();
    } catch (const std::exception& e) {
        spdlog::debug("reading {} failed: {}", path, e.what());
        return std::unexpected(make_error_code(ParseErrc::read_failed));
    }
}

CliResult show(const std::string& path, const CliArgs& args, std::ostream& out) noexcept {
    if (path != "-" && !PlaylistParser::is_playlist_path(path)) {
        spdlog::info("{} does not have an .m3u8 extension, parsing anyway", path);
    }

    auto text = load_text(path);
    if (!text) {
        return std::unexpected(text.error());
    }

    ParseOptions options;
    if (args.strict) {
        options.numeric_policy = NumericPolicy::strict;
    }

    auto playlist = PlaylistParser::parse(*text, options);
    if (!playlist) {
        return std::unexpected(playlist.error());
    }

    try {
        if (args.json) {
            nlohmann::json j = *playlist;
            // Locator lines are verbatim bytes and may not be valid UTF-8
            out << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        } else {
            print_summary(*playlist, out);
        }
    } catch (const std::exception& e) {
        spdlog::error("printing {} failed: {}", path, e.what());
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }

    return 0;
}

int run(const CliArgs& args, std::ostream& out, std::ostream& err) noexcept {
    int exit_code = 0;
    for (const auto& path : args.paths) {
        if (args.paths.size() > 1 && !args.json) {
            out << "== " << path << '\n';
        }

        auto result = show(path, args, out);
        if (!result) {
            err << "Error: " << path << ": " << result.error().message() << std::endl;
            exit_code = 1;
        }
    }
    return exit_code;
}

void print_summary(const Playlist& playlist, std::ostream& out) {
    out << std::fixed << std::setprecision(3);
    out << "Version:          " << playlist.version() << '\n';
    out << "Target duration:  " << playlist.target_duration().count() << "s\n";
    out << "Ended:            " << (playlist.ended() ? "yes" : "no") << '\n';
    out << "Segments:         " << playlist.segments().size() << '\n';
    out << "Total duration:   " << seconds_of(playlist.total_duration()) << "s\n";

    const auto& groups = playlist.discontinuities();
    out << "Discontinuities:  " << groups.size() << '\n';
    for (std::size_t i = 0; i < groups.size(); ++i) {
        out << "  [" << i << "] " << groups[i].segments.size() << " segments, "
            << seconds_of(groups[i].duration) << "s\n";
    }

    for (const auto& diagnostic : playlist.diagnostics()) {
        out << "Warning: line " << diagnostic.line << ": " << diagnostic.tag
            << ": " << diagnostic.message << '\n';
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Reel v" << reel::version.to_string() << " - HLS media playlist parser\n\n";
    std::cout << "Usage: " << program_name << " [options] <playlist.m3u8|->...\n\n";
    std::cout << "Options:\n";
    std::cout << "  -j, --json       Print the playlist as JSON\n";
    std::cout << "  -s, --strict     Reject malformed numeric tag values\n";
    std::cout << "  -V, --verbose    Verbose logging\n";
    std::cout << "  -q, --quiet      No logging\n";
    std::cout << "  -v, --version    Show version\n";
    std::cout << "  -h, --help       Show this help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " index.m3u8\n";
    std::cout << "  cat index.m3u8 | " << program_name << " --json -\n";
}

void print_version() noexcept {
    std::cout << "Reel v" << reel::version.to_string() << '\n';
}

} // namespace reel::cli
