//
// Created by gregorian-rayne on 10/05/26.
//

#include "ars/serialization/unit_codec.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace ars::codec
{
    namespace {

        json optional_string(const std::optional<std::string>& value) {
            return value.has_value() ? json(*value) : json(nullptr);
        }

        Result<std::string, Error> required_string(const json& obj, const char* key) {
            const auto it = obj.find(key);
            if (it == obj.end() || it->is_null()) {
                return Result<std::string, Error>::failure(
                    Error::parse_error("Missing required field", key)
                );
            }
            if (!it->is_string()) {
                return Result<std::string, Error>::failure(
                    Error::parse_error("Expected a string", key)
                );
            }
            return Result<std::string, Error>::success(it->get<std::string>());
        }

        /**
         * Missing key yields fallback; explicit null yields std::nullopt.
         */
        Result<std::optional<std::string>, Error> nullable_string(
            const json& obj,
            const char* key,
            std::optional<std::string> fallback
        ) {
            using R = Result<std::optional<std::string>, Error>;

            const auto it = obj.find(key);
            if (it == obj.end()) {
                return R::success(std::move(fallback));
            }
            if (it->is_null()) {
                return R::success(std::nullopt);
            }
            if (!it->is_string()) {
                return R::failure(Error::parse_error("Expected a string or null", key));
            }
            return R::success(it->get<std::string>());
        }

        Result<std::int64_t, Error> integer_field(const json& obj, const char* key, std::int64_t fallback) {
            using R = Result<std::int64_t, Error>;

            const auto it = obj.find(key);
            if (it == obj.end()) {
                return R::success(fallback);
            }
            if (it->is_number_unsigned()) {
                const auto number = it->get<std::uint64_t>();
                if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    return R::failure(Error::parse_error("Integer out of range", key));
                }
                return R::success(static_cast<std::int64_t>(number));
            }
            if (it->is_number_integer()) {
                return R::success(it->get<std::int64_t>());
            }
            if (it->is_number_float()) {
                const double number = it->get<double>();
                constexpr double limit = 9.0e18;
                if (std::isfinite(number) && std::floor(number) == number && std::fabs(number) < limit) {
                    return R::success(static_cast<std::int64_t>(number));
                }
            }
            return R::failure(Error::parse_error("Expected an integer", key));
        }

        Error expected_object() {
            return Error::parse_error("Expected a JSON object");
        }

    }  // namespace

    Severity severity_from_string(const std::string& name) noexcept {
        if (name == "info") return Severity::Info;
        if (name == "warning") return Severity::Warning;
        return Severity::Error;
    }

    json encode_finding(const Finding& finding) {
        return json{
            {"prog_name", finding.prog_name},
            {"incl_name", finding.incl_name},
            {"types", finding.types},
            {"blockname", optional_string(finding.blockname)},
            {"starting_line", finding.starting_line},
            {"ending_line", finding.ending_line},
            {"issues_type", finding.issues_type},
            {"severity", to_string(finding.severity)},
            {"message", finding.message},
            {"suggestion", finding.suggestion},
            {"snippet", finding.snippet}
        };
    }

    json encode_unit(const Unit& unit) {
        json findings = nullptr;
        if (unit.findings.has_value()) {
            findings = json::array();
            for (const auto& finding : *unit.findings) {
                findings.push_back(encode_finding(finding));
            }
        }

        return json{
            {"pgm_name", unit.pgm_name},
            {"inc_name", unit.inc_name},
            {"type", unit.type},
            {"name", optional_string(unit.name)},
            {"class_implementation", optional_string(unit.class_implementation)},
            {"start_line", unit.start_line},
            {"end_line", unit.end_line},
            {"code", unit.code},
            {"findings", std::move(findings)}
        };
    }

    json encode_units(const std::vector<Unit>& units) {
        json result = json::array();
        for (const auto& unit : units) {
            result.push_back(encode_unit(unit));
        }
        return result;
    }

    Result<Finding, Error> decode_finding(const json& value) {
        if (!value.is_object()) {
            return Result<Finding, Error>::failure(expected_object());
        }

        Finding finding;

        for (auto [key, target] : {
                 std::pair{"prog_name", &finding.prog_name},
                 std::pair{"incl_name", &finding.incl_name},
                 std::pair{"types", &finding.types},
                 std::pair{"issues_type", &finding.issues_type},
                 std::pair{"message", &finding.message},
                 std::pair{"suggestion", &finding.suggestion},
                 std::pair{"snippet", &finding.snippet}}) {
            auto field = nullable_string(value, key, std::string{});
            if (field.is_err()) {
                return Result<Finding, Error>::failure(field.error());
            }
            *target = field.value().value_or("");
        }

        auto blockname = nullable_string(value, "blockname", std::nullopt);
        if (blockname.is_err()) {
            return Result<Finding, Error>::failure(blockname.error());
        }
        finding.blockname = std::move(blockname).value();

        auto severity = nullable_string(value, "severity", std::string{"error"});
        if (severity.is_err()) {
            return Result<Finding, Error>::failure(severity.error());
        }
        finding.severity = severity_from_string(severity.value().value_or("error"));

        auto starting_line = integer_field(value, "starting_line", 0);
        if (starting_line.is_err()) {
            return Result<Finding, Error>::failure(starting_line.error());
        }
        finding.starting_line = starting_line.value();

        auto ending_line = integer_field(value, "ending_line", finding.starting_line);
        if (ending_line.is_err()) {
            return Result<Finding, Error>::failure(ending_line.error());
        }
        finding.ending_line = ending_line.value();

        return Result<Finding, Error>::success(std::move(finding));
    }

    Result<Unit, Error> decode_unit(const json& value) {
        using R = Result<Unit, Error>;

        if (!value.is_object()) {
            return R::failure(expected_object());
        }

        Unit unit;

        auto pgm_name = required_string(value, "pgm_name");
        if (pgm_name.is_err()) return R::failure(pgm_name.error());
        unit.pgm_name = std::move(pgm_name).value();

        auto inc_name = required_string(value, "inc_name");
        if (inc_name.is_err()) return R::failure(inc_name.error());
        unit.inc_name = std::move(inc_name).value();

        auto type = required_string(value, "type");
        if (type.is_err()) return R::failure(type.error());
        unit.type = std::move(type).value();

        auto name = nullable_string(value, "name", std::string{});
        if (name.is_err()) return R::failure(name.error());
        unit.name = std::move(name).value();

        auto class_impl = nullable_string(value, "class_implementation", std::nullopt);
        if (class_impl.is_err()) return R::failure(class_impl.error());
        unit.class_implementation = std::move(class_impl).value();

        auto start_line = integer_field(value, "start_line", 0);
        if (start_line.is_err()) return R::failure(start_line.error());
        unit.start_line = start_line.value();

        auto end_line = integer_field(value, "end_line", 0);
        if (end_line.is_err()) return R::failure(end_line.error());
        unit.end_line = end_line.value();

        auto code = nullable_string(value, "code", std::string{});
        if (code.is_err()) return R::failure(code.error());
        unit.code = std::move(code).value().value_or("");

        if (const auto it = value.find("findings"); it != value.end() && !it->is_null()) {
            if (!it->is_array()) {
                return R::failure(Error::parse_error("Expected an array or null", "findings"));
            }

            std::vector<Finding> findings;
            findings.reserve(it->size());
            for (std::size_t i = 0; i < it->size(); ++i) {
                auto finding = decode_finding((*it)[i]);
                if (finding.is_err()) {
                    return R::failure(finding.error()
                        .with_context_prefix("[" + std::to_string(i) + "]")
                        .with_context_prefix("findings"));
                }
                findings.push_back(std::move(finding).value());
            }
            unit.findings = std::move(findings);
        }

        return R::success(std::move(unit));
    }

    Result<std::vector<Unit>, Error> decode_units(const json& value) {
        using R = Result<std::vector<Unit>, Error>;

        if (!value.is_array()) {
            return R::failure(Error::parse_error("Expected a JSON array of units"));
        }

        std::vector<Unit> units;
        units.reserve(value.size());

        for (std::size_t i = 0; i < value.size(); ++i) {
            auto unit = decode_unit(value[i]);
            if (unit.is_err()) {
                return R::failure(unit.error().with_context_prefix("[" + std::to_string(i) + "]"));
            }
            units.push_back(std::move(unit).value());
        }

        return R::success(std::move(units));
    }
}  // namespace ars::codec
