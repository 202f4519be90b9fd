// Copyright (c) 2026 changcheng967. All rights reserved.

#include <vault/cli/commands.hpp>
#include <iostream>

using namespace vault::cli;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    if (args.command.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    auto result = run(args);
    if (!result) {
        const auto& error = result.error();
        std::cerr << "Error: " << error.user_message() << std::endl;
        if (args.verbose || error.is(vault::core::VaultErrc::invalid_input)) {
            std::cerr << "  " << error.message() << std::endl;
        }
        if (error.recoverable()) {
            std::cerr << "Run the same command again to resume." << std::endl;
            return 2;
        }
        return 1;
    }
    return *result;
}
