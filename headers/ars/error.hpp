//
// Created by gregorian-rayne on 10/02/26.
//

#ifndef ARS_ERROR_HPP
#define ARS_ERROR_HPP

/**
 * @file error.hpp
 * @brief Errors raised where outside data enters the scanner.
 *
 * Scanning a decoded unit cannot fail. An Error comes from the edges only:
 * a JSON payload that is not a valid Unit, a file that cannot be read, a
 * bad TOML configuration, a socket that cannot be bound.
 *
 * The context is a locator for the offending input. For units it is the
 * JSON field path, built up while the decoder unwinds:
 *
 * @code
 *     auto units = codec::decode_units(payload);
 *     if (units.is_err()) {
 *         std::cerr << units.error() << std::endl;
 *         // [ParseError] Missing required field (context: [3].pgm_name)
 *     }
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace ars {

    enum class ErrorCode {
        InvalidArgument,  ///< Caller passed something unusable (bad listen address)
        NotFound,         ///< Missing file or configuration key
        ParseError,       ///< Malformed JSON or a payload that is not a Unit
        IoError,          ///< Read or write failed
        ConfigError,      ///< Configuration rejected by validation
        NetworkError,     ///< Socket setup or transfer failed
        InternalError     ///< Serialization failed unexpectedly
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::NetworkError:    return "NetworkError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    class Error {
    public:
        Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error network_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::NetworkError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, std::optional<std::string> context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        /**
         * Returns a copy whose context is nested under prefix.
         *
         * "start_line" under "[3]" becomes "[3].start_line"; "[0].snippet"
         * under "findings" becomes "findings[0].snippet". An error without
         * context takes prefix as its whole context.
         */
        [[nodiscard]] Error with_context_prefix(const std::string& prefix) const {
            if (!context_.has_value() || context_->empty()) {
                return {code_, message_, prefix};
            }
            if (context_->front() == '[') {
                return {code_, message_, prefix + *context_};
            }
            return {code_, message_, prefix + "." + *context_};
        }

        /**
         * "[ParseError] message (context: ...)"; the context part is left
         * out when there is none.
         */
        [[nodiscard]] std::string to_string() const {
            std::string text = "[";
            text += error_code_to_string(code_);
            text += "] ";
            text += message_;
            if (context_) {
                text += " (context: " + *context_ + ")";
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace ars

#endif //ARS_ERROR_HPP
