//
// Created by gregorian-rayne on 10/09/26.
//

#include "app.hpp"
#include "server.hpp"
#include "ars/rules/all_rules.hpp"
#include "ars/scanner/scanner.hpp"
#include "ars/serialization/unit_codec.hpp"
#include "ars/service/scan_api.hpp"
#include "ars/utils/json_utils.hpp"
#include "ars/utils/log.hpp"
#include "ars/utils/parallel.hpp"
#include "ars/version.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <utility>

namespace ars::cli {

    namespace {
        std::atomic<service::Server*> g_server{nullptr};

        void handle_stop_signal(int) {
            if (auto* server = g_server.load()) {
                server->request_stop();
            }
        }

        constexpr int EXIT_CLEAN = 0;
        constexpr int EXIT_ERROR = 1;
        constexpr int EXIT_FINDINGS = 2;
    }

    App::App(Options options)
        : options_(std::move(options))
    {
    }

    int App::run() {
        if (auto loaded = load_config(); loaded.is_err()) {
            std::cerr << "Configuration error: " << loaded.error().to_string() << "\n";
            return EXIT_ERROR;
        }

        switch (options_.command) {
            case Command::SCAN:
                return run_scan();
            case Command::SERVE:
                return run_serve();
            case Command::RULES:
                return run_rules();
            default:
                std::cerr << "Unknown command\n";
                return EXIT_ERROR;
        }
    }

    Result<void> App::load_config() {
        if (options_.config_file) {
            auto loaded = config::Config::load_from_file(*options_.config_file);
            if (loaded.is_err()) {
                return Result<void>::failure(loaded.error());
            }
            config_ = std::move(loaded.value());
        }

        if (options_.host) config_.server.host = *options_.host;
        if (options_.port) config_.server.port = *options_.port;
        if (options_.threads) {
            if (options_.command == Command::SERVE) {
                config_.server.threads = *options_.threads;
            } else {
                config_.scan.threads = *options_.threads;
            }
        }
        if (options_.sequential) config_.scan.parallel = false;
        if (options_.verbose) {
            config_.logging.verbose = true;
            config_.logging.level = config::LogLevel::DEBUG;
        }

        if (auto validation = config_.validate(); validation.is_err()) {
            return validation;
        }

        log::set_level(config_.logging.level);
        return Result<void>::success();
    }

    Result<rules::RuleSet> App::build_rule_set() const {
        auto all = rules::default_rule_set();
        if (config_.scan.rules.empty()) {
            return Result<rules::RuleSet>::success(std::move(all));
        }

        for (const auto& id : config_.scan.rules) {
            if (all.find(id) == nullptr) {
                log::warn("Unknown rule id in [scan] rules: " + id);
            }
        }

        auto selected = all.select(config_.scan.rules);
        if (selected.empty()) {
            return Result<rules::RuleSet>::failure(
                Error::config_error("No known rule selected", "scan.rules"));
        }
        return Result<rules::RuleSet>::success(std::move(selected));
    }

    Result<LoadedUnits> App::load_units(const std::string& file_path) {
        auto document = json_utils::read_file(file_path);
        if (document.is_err()) {
            return Result<LoadedUnits>::failure(document.error());
        }

        const auto& value = document.value();
        if (value.is_object()) {
            auto unit = codec::decode_unit(value);
            if (unit.is_err()) {
                return Result<LoadedUnits>::failure(unit.error());
            }
            return Result<LoadedUnits>::success(LoadedUnits{{std::move(unit.value())}, true});
        }

        auto units = codec::decode_units(value);
        if (units.is_err()) {
            return Result<LoadedUnits>::failure(units.error());
        }
        return Result<LoadedUnits>::success(LoadedUnits{std::move(units.value()), false});
    }

    int App::run_scan() const {
        if (options_.input_files.empty()) {
            std::cerr << "Error: No input file specified\n";
            CliParser::print_command_help(Command::SCAN);
            return EXIT_ERROR;
        }
        if (options_.input_files.size() > 1) {
            std::cerr << "Error: scan takes exactly one input file\n";
            return EXIT_ERROR;
        }

        auto rule_set = build_rule_set();
        if (rule_set.is_err()) {
            std::cerr << "Error: " << rule_set.error().to_string() << "\n";
            return EXIT_ERROR;
        }

        const std::string& input = options_.input_files.front();
        auto loaded = load_units(input);
        if (loaded.is_err()) {
            std::cerr << "Error: " << loaded.error().to_string() << "\n";
            return EXIT_ERROR;
        }

        const scanner::Scanner scanner(rule_set.value());
        const auto& [units, single] = loaded.value();
        log::debug("Scanning " + std::to_string(units.size()) + " unit(s) from " + input);

        std::vector<Unit> scanned;
        if (single) {
            scanned.push_back(scanner.scan_one(units.front()));
        } else {
            const auto mode = options_.keep_all ? scanner::BatchMode::KeepAll : scanner::BatchMode::FindingsOnly;
            if (config_.scan.parallel && units.size() > 1) {
                parallel::ThreadPool pool(static_cast<unsigned int>(config_.scan.threads));
                log::debug("Using " + std::to_string(pool.size()) + " scan threads");
                scanned = scanner.scan_many(units, mode, pool);
            } else {
                scanned = scanner.scan_many(units, mode);
            }
        }

        const auto summary = scanner::summarize(scanned);
        log::debug("Found " + std::to_string(summary.total_findings) + " finding(s) in "
                   + std::to_string(summary.units_with_findings) + " unit(s)");

        if (options_.format == "text") {
            std::ostringstream report;
            print_text_report(report, scanned);

            if (options_.output_file.empty()) {
                std::cout << report.str();
            } else {
                std::ofstream file(options_.output_file);
                if (!file || !(file << report.str())) {
                    std::cerr << "Error: Failed to write " << options_.output_file << "\n";
                    return EXIT_ERROR;
                }
            }
        } else {
            const auto output = single ? codec::encode_unit(scanned.front()) : codec::encode_units(scanned);

            if (options_.output_file.empty()) {
                std::cout << json_utils::to_string(output, 2) << "\n";
            } else if (auto written = json_utils::write_file(options_.output_file, output); written.is_err()) {
                std::cerr << "Error: " << written.error().to_string() << "\n";
                return EXIT_ERROR;
            }
        }

        if (!options_.output_file.empty()) {
            log::info("Results written to " + options_.output_file);
        }

        return summary.total_findings > 0 ? EXIT_FINDINGS : EXIT_CLEAN;
    }

    int App::run_serve() const {
        auto rule_set = build_rule_set();
        if (rule_set.is_err()) {
            std::cerr << "Error: " << rule_set.error().to_string() << "\n";
            return EXIT_ERROR;
        }

        const scanner::Scanner scanner(rule_set.value());

        std::unique_ptr<parallel::ThreadPool> scan_pool;
        if (config_.scan.parallel) {
            scan_pool = std::make_unique<parallel::ThreadPool>(static_cast<unsigned int>(config_.scan.threads));
        }

        const service::ScanApi api(scanner, scan_pool.get());
        service::Server server(config_.server, api, config_.logging.verbose);

        log::info(std::string(PROJECT_NAME) + " " + VERSION_STRING);
        for (const auto& rule : rule_set.value().rules()) {
            log::info("Rule enabled: " + std::string(rule->id()));
        }

        g_server.store(&server);
        std::signal(SIGINT, handle_stop_signal);
        std::signal(SIGTERM, handle_stop_signal);

        auto result = server.start();

        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        g_server.store(nullptr);

        if (result.is_err()) {
            std::cerr << "Error: " << result.error().to_string() << "\n";
            return EXIT_ERROR;
        }
        return EXIT_CLEAN;
    }

    int App::run_rules() const {
        auto rule_set = build_rule_set();
        if (rule_set.is_err()) {
            std::cerr << "Error: " << rule_set.error().to_string() << "\n";
            return EXIT_ERROR;
        }

        std::cout << "Active rules:\n\n";
        for (const auto& rule : rule_set.value().rules()) {
            std::cout << "  " << rule->number() << "  " << rule->id() << "\n";
            std::cout << "       " << rule->message() << "\n";
            std::cout << "       Suggestion: " << rule->suggestion() << "\n\n";
        }
        return EXIT_CLEAN;
    }

    void App::print_text_report(std::ostream& out, const std::vector<Unit>& units) {
        for (const auto& unit : units) {
            out << unit.pgm_name << " / " << unit.inc_name << " [" << unit.type;
            if (unit.name && !unit.name->empty()) {
                out << " " << *unit.name;
            }
            out << "] lines " << unit.start_line << "-" << unit.end_line
                << ": " << unit.finding_count() << " finding(s)\n";

            if (!unit.findings) {
                continue;
            }
            for (const auto& finding : *unit.findings) {
                out << "  line " << finding.starting_line << "  " << finding.issues_type
                    << " (" << to_string(finding.severity) << ")\n";
                out << "    " << finding.message << "\n";
                out << "    > " << finding.snippet << "\n";
                out << "    Suggestion: " << finding.suggestion << "\n";
            }
        }

        const auto summary = scanner::summarize(units);
        out << "\nSummary: " << summary.units_scanned << " unit(s) reported, "
            << summary.units_with_findings << " with findings, "
            << summary.total_findings << " finding(s)\n";
        for (const auto& [rule_id, count] : summary.findings_by_rule) {
            out << "  " << rule_id << ": " << count << "\n";
        }
    }

} // namespace ars::cli
