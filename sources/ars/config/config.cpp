//
// Created by gregorian-rayne on 10/06/26.
//

#include "ars/config/config.hpp"

#include <toml++/toml.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <sstream>

namespace ars::config
{
    namespace {

        std::string join(const std::vector<std::string>& parts, const std::string& separator) {
            std::string result;
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (i > 0) result += separator;
                result += parts[i];
            }
            return result;
        }

        std::string quoted(const std::string& value) {
            std::string result = "\"";
            for (const char c : value) {
                if (c == '"' || c == '\\') result += '\\';
                result += c;
            }
            result += '"';
            return result;
        }

        Result<Config> from_table(const toml::table& tbl) {
            Config config;

            if (const auto* server = tbl["server"].as_table()) {
                auto& s = config.server;
                s.host = (*server)["host"].value_or(s.host);
                s.port = (*server)["port"].value_or(s.port);
                s.threads = (*server)["threads"].value_or(s.threads);
                s.max_connections = (*server)["max_connections"].value_or(s.max_connections);
                s.accept_timeout_sec = (*server)["accept_timeout_sec"].value_or(s.accept_timeout_sec);
                s.read_timeout_sec = (*server)["read_timeout_sec"].value_or(s.read_timeout_sec);
                s.write_timeout_sec = (*server)["write_timeout_sec"].value_or(s.write_timeout_sec);

                const auto max_request = (*server)["max_request_size"].value_or(
                    static_cast<std::int64_t>(s.max_request_size));
                if (max_request <= 0) {
                    return Result<Config>::failure(
                        Error::config_error("max_request_size must be positive", "server.max_request_size"));
                }
                s.max_request_size = static_cast<std::size_t>(max_request);
            }

            if (const auto* scan = tbl["scan"].as_table()) {
                config.scan.parallel = (*scan)["parallel"].value_or(config.scan.parallel);
                config.scan.threads = (*scan)["threads"].value_or(config.scan.threads);

                if (const auto* rules = (*scan)["rules"].as_array()) {
                    config.scan.rules.clear();
                    for (const auto& rule : *rules) {
                        if (const auto id = rule.value<std::string>()) {
                            config.scan.rules.push_back(*id);
                        }
                    }
                }
            }

            if (const auto* logging = tbl["logging"].as_table()) {
                if (const auto level = (*logging)["level"].value<std::string>()) {
                    auto parsed = log_level_from_string(*level);
                    if (parsed.is_err()) {
                        return Result<Config>::failure(parsed.error());
                    }
                    config.logging.level = parsed.value();
                }
                config.logging.verbose = (*logging)["verbose"].value_or(config.logging.verbose);
            }

            if (auto validation = config.validate(); validation.is_err()) {
                return Result<Config>::failure(validation.error());
            }

            return Result<Config>::success(std::move(config));
        }

    }  // namespace

    Result<Config> Config::load_from_file(const std::string& path) {
        if (std::error_code ec; !std::filesystem::exists(path, ec)) {
            return Result<Config>::failure(Error::not_found("Configuration file not found", path));
        }

        try {
            return from_table(toml::parse_file(path));
        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()), path));
        }
    }

    Result<Config> Config::load_from_string(const std::string& content) {
        try {
            return from_table(toml::parse(content));
        } catch (const toml::parse_error& err) {
            return Result<Config>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description())));
        }
    }

    Config Config::default_config() {
        return Config{};
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[server]\n";
        ss << "host = " << quoted(server.host) << "\n";
        ss << "port = " << server.port << "\n";
        ss << "threads = " << server.threads << "\n";
        ss << "max_connections = " << server.max_connections << "\n";
        ss << "accept_timeout_sec = " << server.accept_timeout_sec << "\n";
        ss << "read_timeout_sec = " << server.read_timeout_sec << "\n";
        ss << "write_timeout_sec = " << server.write_timeout_sec << "\n";
        ss << "max_request_size = " << server.max_request_size << "\n\n";

        ss << "[scan]\n";
        ss << "parallel = " << (scan.parallel ? "true" : "false") << "\n";
        ss << "threads = " << scan.threads << "\n";
        ss << "rules = [";
        for (std::size_t i = 0; i < scan.rules.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << quoted(scan.rules[i]);
        }
        ss << "]\n\n";

        ss << "[logging]\n";
        ss << "level = " << quoted(config::to_string(logging.level)) << "\n";
        ss << "verbose = " << (logging.verbose ? "true" : "false") << "\n";

        return ss.str();
    }

    Result<void> Config::validate() const {
        std::vector<std::string> errors;

        if (server.host.empty()) {
            errors.emplace_back("server.host must not be empty");
        }

        if (server.port <= 0 || server.port > 65535) {
            errors.emplace_back("server.port must be between 1 and 65535");
        }

        if (server.threads < 0) {
            errors.emplace_back("server.threads must be non-negative");
        }

        if (server.max_connections <= 0) {
            errors.emplace_back("server.max_connections must be positive");
        }

        if (server.accept_timeout_sec <= 0 || server.read_timeout_sec <= 0 || server.write_timeout_sec <= 0) {
            errors.emplace_back("server timeouts must be positive");
        }

        if (server.max_request_size == 0) {
            errors.emplace_back("server.max_request_size must be positive");
        }

        if (scan.threads < 0) {
            errors.emplace_back("scan.threads must be non-negative");
        }

        if (!errors.empty()) {
            return Result<void>::failure(
                Error::config_error("Configuration validation failed:\n  " + join(errors, "\n  ")));
        }

        return Result<void>::success();
    }

    std::string to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
        }
        return "INFO";
    }

    Result<LogLevel> log_level_from_string(const std::string& str) {
        std::string upper = str;
        std::ranges::transform(upper, upper.begin(), [](const unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });

        if (upper == "DEBUG") return Result<LogLevel>::success(LogLevel::DEBUG);
        if (upper == "INFO") return Result<LogLevel>::success(LogLevel::INFO);
        if (upper == "WARN" || upper == "WARNING") return Result<LogLevel>::success(LogLevel::WARN);
        if (upper == "ERROR") return Result<LogLevel>::success(LogLevel::ERROR);

        return Result<LogLevel>::failure(Error::config_error("Unknown log level: " + str, "logging.level"));
    }
}  // namespace ars::config
