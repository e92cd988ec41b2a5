//
// Created by gregorian-rayne on 10/07/26.
//

#include "ars/utils/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace ars::log
{
    namespace {

        std::atomic<LogLevel> current_level{LogLevel::INFO};
        std::mutex output_mutex;

    }  // namespace

    void set_level(const LogLevel level) noexcept {
        current_level.store(level, std::memory_order_relaxed);
    }

    LogLevel level() noexcept {
        return current_level.load(std::memory_order_relaxed);
    }

    bool enabled(const LogLevel level) noexcept {
        return static_cast<int>(level) >= static_cast<int>(current_level.load(std::memory_order_relaxed));
    }

    void write(const LogLevel level, const std::string_view message) {
        if (!enabled(level)) {
            return;
        }

        std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;

        std::lock_guard lock(output_mutex);
        out << "[" << config::to_string(level) << "] " << message << std::endl;
    }
}  // namespace ars::log
