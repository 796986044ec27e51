// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/cli/commands.hpp>
#include <iostream>

using namespace reel::cli;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (args.paths.empty()) {
        std::cerr << "Error: No playlist specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    configure_logging(args);

    return run(args, std::cout, std::cerr);
}
