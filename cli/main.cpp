#include "cli_parser.hpp"
#include "app.hpp"

#include <exception>
#include <iostream>

int main(const int argc, char** argv) {
    try {
        const csa::cli::Options options = csa::cli::CliParser::parse(argc, argv);

        if (!options.errors.empty()) {
            for (const auto& error : options.errors) {
                std::cerr << "Error: " << error << "\n";
            }
            std::cerr << "Run 'csa help' for usage.\n";
            return 2;
        }

        if (options.command == csa::cli::Command::HELP) {
            csa::cli::CliParser::print_help();
            return 0;
        }

        if (options.command == csa::cli::Command::VERSION) {
            csa::cli::CliParser::print_version();
            return 0;
        }

        if (options.command_help) {
            csa::cli::CliParser::print_command_help(options.command);
            return 0;
        }

        csa::cli::App app(options);
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
