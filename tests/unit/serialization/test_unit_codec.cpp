//
// Created by gregorian-rayne on 10/11/26.
//

#include "ars/serialization/unit_codec.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

namespace ars::codec
{
    namespace {

        json sample_unit_json() {
            return json::parse(R"({
                "pgm_name": "ZPROG",
                "inc_name": "ZPROG_TOP",
                "type": "METHOD",
                "name": "RUN",
                "class_implementation": "LCL_APP",
                "start_line": 40,
                "end_line": 52,
                "code": "BREAK-POINT.\n"
            })");
        }

        Finding sample_finding() {
            Finding finding;
            finding.prog_name = "ZPROG";
            finding.incl_name = "ZPROG_TOP";
            finding.types = "METHOD";
            finding.blockname = "RUN";
            finding.starting_line = 41;
            finding.ending_line = 41;
            finding.issues_type = "Rule304_BreakPointUsage";
            finding.message = "BREAK-POINT is not allowed in ABAP Cloud / Key User scenarios.";
            finding.suggestion = "Remove or comment out the BREAK-POINT statement.";
            finding.snippet = "BREAK-POINT.";
            return finding;
        }

    }  // namespace

    TEST(UnitCodecTest, DecodeFullUnit) {
        const auto result = decode_unit(sample_unit_json());

        ASSERT_TRUE(result.is_ok()) << result.error();
        const auto& unit = result.value();
        EXPECT_EQ(unit.pgm_name, "ZPROG");
        EXPECT_EQ(unit.inc_name, "ZPROG_TOP");
        EXPECT_EQ(unit.type, "METHOD");
        EXPECT_EQ(unit.name, "RUN");
        EXPECT_EQ(unit.class_implementation, "LCL_APP");
        EXPECT_EQ(unit.start_line, 40);
        EXPECT_EQ(unit.end_line, 52);
        EXPECT_EQ(unit.code, "BREAK-POINT.\n");
        EXPECT_FALSE(unit.findings.has_value());
    }

    TEST(UnitCodecTest, OptionalFieldsDefault) {
        const auto result = decode_unit(json::parse(R"({
            "pgm_name": "ZPROG", "inc_name": "ZPROG", "type": "REPORT"
        })"));

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().name, std::string{});
        EXPECT_FALSE(result.value().class_implementation.has_value());
        EXPECT_EQ(result.value().start_line, 0);
        EXPECT_EQ(result.value().code, "");
    }

    TEST(UnitCodecTest, ExplicitNullsAreAccepted) {
        auto payload = sample_unit_json();
        payload["name"] = nullptr;
        payload["class_implementation"] = nullptr;
        payload["code"] = nullptr;
        payload["findings"] = nullptr;

        const auto result = decode_unit(payload);

        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.value().name.has_value());
        EXPECT_FALSE(result.value().class_implementation.has_value());
        EXPECT_EQ(result.value().code, "");
        EXPECT_FALSE(result.value().findings.has_value());
    }

    TEST(UnitCodecTest, IntegralFloatLinesAreAccepted) {
        auto payload = sample_unit_json();
        payload["start_line"] = 12.0;

        const auto result = decode_unit(payload);
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().start_line, 12);
    }

    TEST(UnitCodecTest, LineNumbersUpToInt64MaxAreAccepted) {
        auto payload = sample_unit_json();
        payload["start_line"] = std::numeric_limits<std::int64_t>::max();
        payload["end_line"] = std::numeric_limits<std::int64_t>::min();

        const auto result = decode_unit(payload);
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().start_line, std::numeric_limits<std::int64_t>::max());
        EXPECT_EQ(result.value().end_line, std::numeric_limits<std::int64_t>::min());
    }

    TEST(UnitCodecTest, LineNumbersAboveInt64MaxAreRejected) {
        const auto payload = json::parse(R"({
            "pgm_name": "ZPROG",
            "inc_name": "ZPROG_TOP",
            "type": "FORM",
            "start_line": 9223372036854775808,
            "code": "BREAK-POINT."
        })");
        ASSERT_TRUE(payload["start_line"].is_number_unsigned());

        const auto result = decode_unit(payload);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().context().value(), "start_line");

        auto max_unsigned = sample_unit_json();
        max_unsigned["end_line"] = std::numeric_limits<std::uint64_t>::max();
        EXPECT_EQ(decode_unit(max_unsigned).error().context().value(), "end_line");
    }

    TEST(UnitCodecTest, MissingRequiredFieldNamesField) {
        auto payload = sample_unit_json();
        payload.erase("pgm_name");

        const auto result = decode_unit(payload);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().context().value(), "pgm_name");
    }

    TEST(UnitCodecTest, WrongTypesAreRejected) {
        auto bad_type = sample_unit_json();
        bad_type["type"] = 7;
        EXPECT_EQ(decode_unit(bad_type).error().context().value(), "type");

        auto bad_line = sample_unit_json();
        bad_line["start_line"] = "ten";
        EXPECT_EQ(decode_unit(bad_line).error().context().value(), "start_line");

        auto fractional = sample_unit_json();
        fractional["end_line"] = 3.5;
        EXPECT_EQ(decode_unit(fractional).error().context().value(), "end_line");

        auto bad_code = sample_unit_json();
        bad_code["code"] = json::array();
        EXPECT_EQ(decode_unit(bad_code).error().context().value(), "code");
    }

    TEST(UnitCodecTest, NonObjectIsRejected) {
        EXPECT_TRUE(decode_unit(json::array()).is_err());
        EXPECT_TRUE(decode_unit(json("unit")).is_err());
    }

    TEST(UnitCodecTest, DecodeUnitsReportsIndexOfBadElement) {
        auto bad = sample_unit_json();
        bad.erase("inc_name");
        const json payload = json::array({sample_unit_json(), sample_unit_json(), bad});

        const auto result = decode_units(payload);

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "[2].inc_name");
    }

    TEST(UnitCodecTest, DecodeUnitsRequiresArray) {
        const auto result = decode_units(sample_unit_json());
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
    }

    TEST(UnitCodecTest, DecodeUnitsAcceptsEmptyArray) {
        const auto result = decode_units(json::array());
        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

    TEST(UnitCodecTest, NestedFindingErrorCarriesPath) {
        auto payload = sample_unit_json();
        auto finding = encode_finding(sample_finding());
        finding["starting_line"] = "x";
        payload["findings"] = json::array({encode_finding(sample_finding()), finding});

        const auto result = decode_units(json::array({payload}));

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "[0].findings[1].starting_line");
    }

    TEST(UnitCodecTest, EncodeFindingUsesWireNames) {
        const auto encoded = encode_finding(sample_finding());

        EXPECT_EQ(encoded["prog_name"], "ZPROG");
        EXPECT_EQ(encoded["incl_name"], "ZPROG_TOP");
        EXPECT_EQ(encoded["types"], "METHOD");
        EXPECT_EQ(encoded["blockname"], "RUN");
        EXPECT_EQ(encoded["starting_line"], 41);
        EXPECT_EQ(encoded["ending_line"], 41);
        EXPECT_EQ(encoded["issues_type"], "Rule304_BreakPointUsage");
        EXPECT_EQ(encoded["severity"], "error");
        EXPECT_EQ(encoded["snippet"], "BREAK-POINT.");
        EXPECT_EQ(encoded.size(), 11u);
    }

    TEST(UnitCodecTest, EncodeUnitWritesAbsentOptionalsAsNull) {
        Unit unit;
        unit.pgm_name = "ZPROG";
        unit.inc_name = "ZPROG";
        unit.type = "REPORT";
        unit.name = std::nullopt;

        const auto encoded = encode_unit(unit);

        EXPECT_TRUE(encoded["name"].is_null());
        EXPECT_TRUE(encoded["class_implementation"].is_null());
        EXPECT_TRUE(encoded["findings"].is_null());
        EXPECT_EQ(encoded["code"], "");
    }

    TEST(UnitCodecTest, EncodedUnitDecodesToSameUnit) {
        Unit unit = decode_unit(sample_unit_json()).value();
        unit.findings = std::vector<Finding>{sample_finding()};

        const auto decoded = decode_unit(encode_unit(unit));

        ASSERT_TRUE(decoded.is_ok());
        EXPECT_EQ(decoded.value(), unit);
    }

    TEST(UnitCodecTest, SeverityNames) {
        EXPECT_EQ(severity_from_string("info"), Severity::Info);
        EXPECT_EQ(severity_from_string("warning"), Severity::Warning);
        EXPECT_EQ(severity_from_string("error"), Severity::Error);
        EXPECT_EQ(severity_from_string("other"), Severity::Error);
    }

}  // namespace ars::codec
