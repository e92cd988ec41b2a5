//
// Created by gregorian-rayne on 10/02/26.
//

#ifndef ARS_RESULT_HPP
#define ARS_RESULT_HPP

/**
 * @file result.hpp
 * @brief Success-or-error return type for the boundary layers.
 *
 * Decoders, file helpers, the configuration loader and the server setup
 * return Result so the failure path is handled where it happens:
 *
 * @code
 *     auto config = Config::load_from_file("ars.toml");
 *     if (config.is_err()) {
 *         std::cerr << config.error() << std::endl;
 *         return 1;
 *     }
 * @endcode
 *
 * A decode step that only makes sense after a successful parse is chained
 * with and_then():
 *
 * @code
 *     auto units = json_utils::parse(body).and_then(codec::decode_units);
 * @endcode
 */

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "ars/error.hpp"

namespace ars {

    /**
     * Either a T or an E. Reading the alternative that is not held throws
     * std::logic_error.
     */
    template<typename T, typename E = Error>
    class Result {
    public:
        static Result success(T value) {
            return Result(std::in_place_index<0>, std::move(value));
        }

        static Result failure(E error) {
            return Result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return data_.index() == 0;
        }

        [[nodiscard]] bool is_err() const noexcept {
            return data_.index() == 1;
        }

        T& value() & {
            check_ok();
            return std::get<0>(data_);
        }

        const T& value() const& {
            check_ok();
            return std::get<0>(data_);
        }

        T&& value() && {
            check_ok();
            return std::get<0>(std::move(data_));
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return std::get<1>(data_);
        }

        /**
         * Hands the success value to f, which returns the next Result. An
         * error skips f and is carried into the new result type.
         */
        template<typename F>
        auto and_then(F&& f) && -> std::invoke_result_t<F, T&&> {
            using Next = std::invoke_result_t<F, T&&>;
            if (is_err()) {
                return Next::failure(std::get<1>(std::move(data_)));
            }
            return std::forward<F>(f)(std::get<0>(std::move(data_)));
        }

    private:
        template<std::size_t I, typename V>
        Result(std::in_place_index_t<I> index, V&& value) : data_(index, std::forward<V>(value)) {}

        void check_ok() const {
            if (is_err()) {
                throw std::logic_error("Result::value() called on error result");
            }
        }

        std::variant<T, E> data_;
    };

    /**
     * For operations that either complete or fail.
     */
    template<typename E>
    class Result<void, E> {
    public:
        static Result success() {
            return Result(std::nullopt);
        }

        static Result failure(E error) {
            return Result(std::move(error));
        }

        [[nodiscard]] bool is_ok() const noexcept {
            return !error_.has_value();
        }

        [[nodiscard]] bool is_err() const noexcept {
            return error_.has_value();
        }

        const E& error() const& {
            if (is_ok()) {
                throw std::logic_error("Result::error() called on success result");
            }
            return *error_;
        }

    private:
        explicit Result(std::optional<E> error) : error_(std::move(error)) {}

        std::optional<E> error_;
    };

}  // namespace ars

#endif //ARS_RESULT_HPP
