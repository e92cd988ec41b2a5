//
// Created by gregorian-rayne on 10/09/26.
//

#ifndef ARS_CLI_PARSER_HPP
#define ARS_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <optional>

namespace ars::cli {

    enum class Command {
        SCAN,
        SERVE,
        RULES,
        HELP,
        VERSION,
        UNKNOWN
    };

    struct Options {
        Command command = Command::UNKNOWN;

        std::vector<std::string> input_files;
        std::string output_file;
        std::string format = "json";

        bool keep_all = false;
        bool sequential = false;
        bool verbose = false;

        std::optional<std::string> config_file;
        std::optional<std::string> host;
        std::optional<int> port;
        std::optional<int> threads;
    };

    class CliParser {
    public:
        /**
         * Parses argv. Unknown commands and malformed flag values fall back
         * to HELP after printing what was wrong.
         */
        static Options parse(int argc, char** argv);
        static void print_help();
        static void print_command_help(Command cmd);
        static void print_version();

    private:
        static Command parse_command(const std::string& cmd);
        static Options parse_scan_options(int argc, char** argv, int& index);
        static Options parse_serve_options(int argc, char** argv, int& index);
        static Options parse_rules_options(int argc, char** argv, int& index);
        static std::optional<int> parse_int(const std::string& flag, const char* value);
    };

} // namespace ars::cli

#endif //ARS_CLI_PARSER_HPP
