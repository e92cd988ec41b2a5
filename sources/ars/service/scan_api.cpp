//
// Created by gregorian-rayne on 10/08/26.
//

#include "ars/service/scan_api.hpp"
#include "ars/serialization/unit_codec.hpp"
#include "ars/utils/json_utils.hpp"
#include "ars/version.hpp"

namespace ars::service
{
    namespace {

        using json = nlohmann::json;

        ApiResponse json_response(const int status, const json& body) {
            return ApiResponse{status, "application/json", json_utils::to_string(body)};
        }

        ApiResponse error_response(const int status, const std::string& message) {
            return json_response(status, json{{"error", message}});
        }

        /**
         * Malformed JSON and invalid units are both reported as 422, with the
         * offending field path in "detail".
         */
        ApiResponse validation_error(const Error& error) {
            json body{{"error", error.message()}};
            body["detail"] = error.context().value_or("");
            return json_response(422, body);
        }

        std::string strip_query(const std::string& path) {
            const auto pos = path.find('?');
            return pos == std::string::npos ? path : path.substr(0, pos);
        }

    }  // namespace

    ApiResponse ScanApi::handle(
        const std::string& method,
        const std::string& path,
        const std::string& body
    ) const {
        const std::string route = strip_query(path);

        if (route == "/health") {
            if (method != "GET") {
                return error_response(405, "Method Not Allowed");
            }
            return handle_health();
        }

        if (route == "/remediate") {
            if (method != "POST") {
                return error_response(405, "Method Not Allowed");
            }
            return handle_remediate(body);
        }

        if (route == "/remediate-array") {
            if (method != "POST") {
                return error_response(405, "Method Not Allowed");
            }
            return handle_remediate_array(body);
        }

        return error_response(404, "Not Found");
    }

    ApiResponse ScanApi::handle_health() const {
        return json_response(200, json{
            {"ok", true},
            {"rules", scanner_.rules().numbers()},
            {"version", API_VERSION}
        });
    }

    ApiResponse ScanApi::handle_remediate(const std::string& body) const {
        auto unit = json_utils::parse(body).and_then([](const json& value) {
            return codec::decode_unit(value);
        });
        if (unit.is_err()) {
            return validation_error(unit.error());
        }

        return json_response(200, codec::encode_unit(scanner_.scan_one(unit.value())));
    }

    ApiResponse ScanApi::handle_remediate_array(const std::string& body) const {
        auto units = json_utils::parse(body).and_then([](const json& value) {
            return codec::decode_units(value);
        });
        if (units.is_err()) {
            return validation_error(units.error());
        }

        const auto scanned = pool_ != nullptr
            ? scanner_.scan_many(units.value(), scanner::BatchMode::FindingsOnly, *pool_)
            : scanner_.scan_many(units.value(), scanner::BatchMode::FindingsOnly);

        return json_response(200, codec::encode_units(scanned));
    }

    const char* status_text(const int status) noexcept {
        switch (status) {
            case 200: return "OK";
            case 204: return "No Content";
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 413: return "Payload Too Large";
            case 422: return "Unprocessable Entity";
            case 500: return "Internal Server Error";
            default: return "Unknown";
        }
    }
}  // namespace ars::service
