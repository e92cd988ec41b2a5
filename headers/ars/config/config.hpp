//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef ARS_CONFIG_HPP
#define ARS_CONFIG_HPP

#include "ars/result.hpp"
#include "ars/error.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ars::config {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    struct ServerConfig {
        std::string host = "127.0.0.1";
        int port = 8000;
        int threads = 0;
        int max_connections = 100;
        int accept_timeout_sec = 1;
        int read_timeout_sec = 30;
        int write_timeout_sec = 30;
        std::size_t max_request_size = 10 * 1024 * 1024;
    };

    struct ScanConfig {
        bool parallel = true;
        int threads = 0;
        /// Rule ids to enable; empty enables every built-in rule.
        std::vector<std::string> rules;
    };

    struct LoggingConfig {
        LogLevel level = LogLevel::INFO;
        bool verbose = false;
    };

    class Config {
    public:
        Config() = default;

        ServerConfig server;
        ScanConfig scan;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @return The configuration, NotFound if the file does not exist, or
         *         ConfigError if it cannot be parsed.
         */
        static Result<Config> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text. Keys that are absent keep their
         * default values.
         */
        static Result<Config> load_from_string(const std::string& content);

        static Config default_config();

        /**
         * Serialize the configuration as TOML.
         */
        [[nodiscard]] std::string to_string() const;

        /**
         * Checks value ranges: port in 1..65535, non-negative thread counts,
         * positive timeouts and request size.
         */
        [[nodiscard]] Result<void> validate() const;
    };

    std::string to_string(LogLevel level);

    /**
     * Parses a level name, case-insensitive.
     *
     * @return ConfigError for unknown names.
     */
    Result<LogLevel> log_level_from_string(const std::string& str);

}  // namespace ars::config

#endif //ARS_CONFIG_HPP
