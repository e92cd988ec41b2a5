//
// Created by gregorian-rayne on 10/09/26.
//

#include "cli_parser.hpp"
#include "app.hpp"
#include <iostream>
#include <exception>

int main(const int argc, char** argv) {
    try {
        const ars::cli::Options options = ars::cli::CliParser::parse(argc, argv);

        if (options.command == ars::cli::Command::HELP) {
            ars::cli::CliParser::print_help();
            return 0;
        }

        if (options.command == ars::cli::Command::VERSION) {
            ars::cli::CliParser::print_version();
            return 0;
        }

        ars::cli::App app(options);
        return app.run();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred\n";
        return 1;
    }
}
