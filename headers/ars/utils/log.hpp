//
// Created by gregorian-rayne on 10/07/26.
//

#ifndef ARS_LOG_HPP
#define ARS_LOG_HPP

/**
 * @file log.hpp
 * @brief Console logging with a process-wide level threshold.
 *
 * DEBUG and INFO go to stdout, WARN and ERROR to stderr, each line prefixed
 * with "[LEVEL]". Lines from concurrent threads are not interleaved.
 */

#include "ars/config/config.hpp"

#include <string_view>

namespace ars::log {

    using config::LogLevel;

    void set_level(LogLevel level) noexcept;

    [[nodiscard]] LogLevel level() noexcept;

    [[nodiscard]] bool enabled(LogLevel level) noexcept;

    void write(LogLevel level, std::string_view message);

    inline void debug(std::string_view message) { write(LogLevel::DEBUG, message); }
    inline void info(std::string_view message) { write(LogLevel::INFO, message); }
    inline void warn(std::string_view message) { write(LogLevel::WARN, message); }
    inline void error(std::string_view message) { write(LogLevel::ERROR, message); }

}  // namespace ars::log

#endif //ARS_LOG_HPP
