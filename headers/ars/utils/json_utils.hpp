//
// Created by gregorian-rayne on 10/05/26.
//

#ifndef ARS_JSON_UTILS_HPP
#define ARS_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief nlohmann/json helpers that report failures as Result<T, Error>.
 */

#include "ars/result.hpp"
#include "ars/error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>

namespace ars::json_utils {

    namespace fs = std::filesystem;
    using json = nlohmann::json;

    /**
     * Parses a JSON document held in memory.
     */
    inline Result<json, Error> parse(std::string_view content) {
        try {
            return Result<json, Error>::success(json::parse(content));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", e.what())
            );
        }
    }

    /**
     * Reads and parses a JSON file.
     */
    inline Result<json, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<json, Error>::failure(
                Error::not_found("JSON file not found", path.string())
            );
        }

        std::ifstream file(path);
        if (!file) {
            return Result<json, Error>::failure(
                Error::io_error("Failed to open JSON file", path.string())
            );
        }

        try {
            json data;
            file >> data;
            return Result<json, Error>::success(std::move(data));
        } catch (const json::parse_error& e) {
            return Result<json, Error>::failure(
                Error::parse_error("JSON parse error", path.string() + ": " + e.what())
            );
        }
    }

    /**
     * Writes data to path, creating parent directories as needed.
     *
     * @param indent Indentation level (-1 for compact output).
     */
    inline Result<void, Error> write_file(
        const fs::path& path,
        const json& data,
        int indent = 2
    ) {
        const auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        try {
            file << data.dump(indent);
        } catch (const json::type_error& e) {
            return Result<void, Error>::failure(
                Error::internal_error("JSON serialization error", e.what())
            );
        }

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write JSON file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Serializes data, replacing invalid UTF-8 instead of throwing.
     *
     * ABAP sources exported from legacy systems are not always valid UTF-8;
     * the snippet must still reach the client.
     */
    inline std::string to_string(const json& data, const int indent = -1) {
        return data.dump(indent, ' ', false, json::error_handler_t::replace);
    }

    /**
     * Gets a value from a JSON object, or default_value when the key is
     * missing, null or of the wrong type.
     */
    template<typename T>
    T get_or(const json& obj, const std::string& key, const T& default_value) {
        if (!obj.is_object()) {
            return default_value;
        }
        const auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) {
            return default_value;
        }
        try {
            return it->template get<T>();
        } catch (const json::exception&) {
            return default_value;
        }
    }

}  // namespace ars::json_utils

#endif //ARS_JSON_UTILS_HPP
