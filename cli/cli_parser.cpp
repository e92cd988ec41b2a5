//
// Created by gregorian-rayne on 10/09/26.
//

#include "cli_parser.hpp"
#include "ars/version.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace ars::cli {

    Command CliParser::parse_command(const std::string& cmd) {
        if (cmd == "scan") return Command::SCAN;
        if (cmd == "serve" || cmd == "server") return Command::SERVE;
        if (cmd == "rules") return Command::RULES;
        if (cmd == "help" || cmd == "--help" || cmd == "-h") return Command::HELP;
        if (cmd == "version" || cmd == "--version" || cmd == "-v") return Command::VERSION;
        return Command::UNKNOWN;
    }

    std::optional<int> CliParser::parse_int(const std::string& flag, const char* value) {
        try {
            std::size_t consumed = 0;
            const std::string text = value;
            const int parsed = std::stoi(text, &consumed);
            if (consumed == text.size()) {
                return parsed;
            }
        } catch (const std::logic_error&) {
            // invalid_argument and out_of_range both land here
        }
        std::cerr << "Invalid value for " << flag << ": " << value << "\n";
        return std::nullopt;
    }

    Options CliParser::parse(const int argc, char** argv) {
        if (argc < 2) {
            return Options{.command = Command::HELP};
        }

        const std::string cmd_str = argv[1];
        const Command cmd = parse_command(cmd_str);

        if (cmd == Command::HELP || cmd == Command::VERSION) {
            return Options{.command = cmd};
        }

        if (cmd == Command::UNKNOWN) {
            std::cerr << "Unknown command: " << cmd_str << "\n";
            return Options{.command = Command::HELP};
        }

        if (argc >= 3 && (std::string(argv[2]) == "--help" || std::string(argv[2]) == "-h")) {
            print_command_help(cmd);
            std::exit(0);
        }

        int index = 2;
        switch (cmd) {
            case Command::SCAN:
                return parse_scan_options(argc, argv, index);
            case Command::SERVE:
                return parse_serve_options(argc, argv, index);
            case Command::RULES:
                return parse_rules_options(argc, argv, index);
            default:
                return Options{.command = Command::HELP};
        }
    }

    Options CliParser::parse_scan_options(const int argc, char** argv, int& index) {
        Options opts;
        opts.command = Command::SCAN;

        while (index < argc) {
            if (std::string arg = argv[index++]; arg == "--output" || arg == "-o") {
                if (index < argc) opts.output_file = argv[index++];
            } else if (arg == "--format" || arg == "-f") {
                if (index < argc) opts.format = argv[index++];
            } else if (arg == "--all" || arg == "-a") {
                opts.keep_all = true;
            } else if (arg == "--sequential") {
                opts.sequential = true;
            } else if (arg == "--threads" || arg == "-j") {
                if (index < argc) {
                    opts.threads = parse_int(arg, argv[index++]);
                    if (!opts.threads) return Options{.command = Command::HELP};
                }
            } else if (arg == "--config" || arg == "-c") {
                if (index < argc) opts.config_file = argv[index++];
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else if (arg[0] != '-') {
                opts.input_files.push_back(arg);
            } else {
                std::cerr << "Unknown option for scan: " << arg << "\n";
            }
        }

        if (opts.format != "json" && opts.format != "text") {
            std::cerr << "Unsupported format: " << opts.format << " (expected json or text)\n";
            return Options{.command = Command::HELP};
        }

        return opts;
    }

    Options CliParser::parse_serve_options(const int argc, char** argv, int& index) {
        Options opts;
        opts.command = Command::SERVE;

        while (index < argc) {
            if (std::string arg = argv[index++]; arg == "--port" || arg == "-p") {
                if (index < argc) {
                    opts.port = parse_int(arg, argv[index++]);
                    if (!opts.port) return Options{.command = Command::HELP};
                }
            } else if (arg == "--host") {
                if (index < argc) opts.host = argv[index++];
            } else if (arg == "--threads" || arg == "-j") {
                if (index < argc) {
                    opts.threads = parse_int(arg, argv[index++]);
                    if (!opts.threads) return Options{.command = Command::HELP};
                }
            } else if (arg == "--config" || arg == "-c") {
                if (index < argc) opts.config_file = argv[index++];
            } else if (arg == "--verbose") {
                opts.verbose = true;
            } else {
                std::cerr << "Unknown option for serve: " << arg << "\n";
            }
        }

        return opts;
    }

    Options CliParser::parse_rules_options(const int argc, char** argv, int& index) {
        Options opts;
        opts.command = Command::RULES;

        while (index < argc) {
            if (std::string arg = argv[index++]; arg == "--config" || arg == "-c") {
                if (index < argc) opts.config_file = argv[index++];
            } else {
                std::cerr << "Unknown option for rules: " << arg << "\n";
            }
        }

        return opts;
    }

    void CliParser::print_help() {
        std::cout << R"(
ABAP Rule Scanner (ARS) - Detects obsolete and forbidden ABAP statements

USAGE:
    ars <COMMAND> [OPTIONS]

COMMANDS:
    scan           Scan a JSON file of source units
    serve          Start the HTTP scan service
    rules          List the active rules (-c, --config <file>)
    help           Show this help message
    version        Show version information

SCAN OPTIONS:
    <file>                  JSON file with a unit object or an array of units
    -o, --output <file>     Write results to a file instead of stdout
    -f, --format <fmt>      Output format (json|text, default: json)
    -a, --all               Keep units without findings in array output
    -j, --threads <num>     Worker threads for batch scans (0 = auto)
    --sequential            Scan on the calling thread only
    -c, --config <file>     TOML configuration file
    --verbose               Enable verbose output

SERVE OPTIONS:
    -p, --port <port>       Listen port (default: 8000)
    --host <addr>           Listen address (default: 127.0.0.1)
    -j, --threads <num>     Connection worker threads (0 = auto)
    -c, --config <file>     TOML configuration file
    --verbose               Log every request

EXIT CODES (scan):
    0    No findings
    1    Error
    2    Findings reported
)";
    }

    void CliParser::print_version() {
        std::cout << PROJECT_NAME << " " << VERSION_STRING << "\n";
    }

    void CliParser::print_command_help(const Command cmd) {
        switch (cmd) {
            case Command::SCAN:
                std::cout << R"(ars scan - Scan source units for Rule303/Rule304 violations

USAGE:
    ars scan [OPTIONS] <file>

The file holds one unit object or an array of unit objects, each with
pgm_name, inc_name, type, start_line, end_line and code. Array output only
contains units with findings unless --all is given.

OPTIONS:
    -o, --output <file>     Write results to a file instead of stdout
    -f, --format <fmt>      Output format (json|text, default: json)
    -a, --all               Keep units without findings in array output
    -j, --threads <num>     Worker threads for batch scans (0 = auto)
    --sequential            Scan on the calling thread only
    -c, --config <file>     TOML configuration file
    --verbose               Enable verbose output
)";
                break;
            case Command::SERVE:
                std::cout << R"(ars serve - Start the HTTP scan service

USAGE:
    ars serve [OPTIONS]

ENDPOINTS:
    POST /remediate         Scan one unit
    POST /remediate-array   Scan units, return those with findings
    GET  /health            Liveness probe with active rules and version

OPTIONS:
    -p, --port <port>       Listen port (default: 8000)
    --host <addr>           Listen address (default: 127.0.0.1)
    -j, --threads <num>     Connection worker threads (0 = auto)
    -c, --config <file>     TOML configuration file
    --verbose               Log every request
)";
                break;
            default:
                print_help();
                break;
        }
    }

} // namespace ars::cli
