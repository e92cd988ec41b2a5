//
// Created by gregorian-rayne on 10/12/26.
//

#include "ars/service/scan_api.hpp"
#include "ars/rules/all_rules.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace ars::service
{
    using json = nlohmann::json;

    class ScanApiTest : public ::testing::Test {
    protected:
        static json unit_json(const std::string& name, const std::string& code, const int start_line = 0) {
            return json{
                {"pgm_name", "ZPROG"},
                {"inc_name", "ZPROG_F01"},
                {"type", "FORM"},
                {"name", name},
                {"start_line", start_line},
                {"end_line", start_line + 5},
                {"code", code}
            };
        }

        rules::RuleSet rule_set = rules::default_rule_set();
        scanner::Scanner scanner{rule_set};
        ScanApi api{scanner};
    };

    TEST_F(ScanApiTest, HealthReportsRulesAndVersion) {
        const auto response = api.handle("GET", "/health", "");

        EXPECT_EQ(response.status, 200);
        EXPECT_EQ(response.content_type, "application/json");
        EXPECT_EQ(json::parse(response.body), json::parse(R"({"ok":true,"rules":[303,304],"version":"2.0"})"));
    }

    TEST_F(ScanApiTest, HealthListsOnlyActiveRules) {
        const auto narrow = rule_set.select({rules::BREAK_POINT_ID});
        const scanner::Scanner narrow_scanner(narrow);
        const ScanApi narrow_api(narrow_scanner);

        const auto body = json::parse(narrow_api.handle_health().body);
        EXPECT_EQ(body["rules"], json::array({304}));
    }

    TEST_F(ScanApiTest, RemediateReturnsScannedUnit) {
        const auto request = unit_json("CHECK", "DATA: lv_x TYPE i.\nBREAK-POINT.\n", 100);
        const auto response = api.handle("POST", "/remediate", request.dump());

        ASSERT_EQ(response.status, 200);
        const auto body = json::parse(response.body);
        EXPECT_EQ(body["pgm_name"], "ZPROG");
        EXPECT_EQ(body["code"], request["code"]);
        ASSERT_TRUE(body["findings"].is_array());
        ASSERT_EQ(body["findings"].size(), 1u);
        EXPECT_EQ(body["findings"][0]["starting_line"], 102);
        EXPECT_EQ(body["findings"][0]["issues_type"], "Rule304_BreakPointUsage");
        EXPECT_EQ(body["findings"][0]["blockname"], "CHECK");
        EXPECT_EQ(body["findings"][0]["snippet"], "BREAK-POINT.");
    }

    TEST_F(ScanApiTest, RemediateCleanUnitHasNullFindings) {
        const auto response = api.handle("POST", "/remediate", unit_json("A", "WRITE 'ok'.").dump());

        ASSERT_EQ(response.status, 200);
        EXPECT_TRUE(json::parse(response.body)["findings"].is_null());
    }

    TEST_F(ScanApiTest, RemediateArrayKeepsOnlyUnitsWithFindings) {
        const json request = json::array({
            unit_json("A", "WRITE 'ok'."),
            unit_json("B", "SET EXTENDED CHECK OFF."),
            unit_json("C", ""),
            unit_json("D", "BREAK-POINT ID zgrp.")
        });

        const auto response = api.handle("POST", "/remediate-array", request.dump());

        ASSERT_EQ(response.status, 200);
        const auto body = json::parse(response.body);
        ASSERT_EQ(body.size(), 2u);
        EXPECT_EQ(body[0]["name"], "B");
        EXPECT_EQ(body[1]["name"], "D");
        EXPECT_EQ(body[1]["findings"][0]["snippet"], "BREAK-POINT ID zgrp.");
    }

    TEST_F(ScanApiTest, RemediateArrayOnPoolMatchesSequential) {
        parallel::ThreadPool pool(3);
        const ScanApi pooled(scanner, &pool);

        json request = json::array();
        for (int i = 0; i < 20; ++i) {
            request.push_back(unit_json("U" + std::to_string(i), i % 2 == 0 ? "BREAK-POINT." : "WRITE 1.", i * 10));
        }

        const auto sequential = api.handle_remediate_array(request.dump());
        const auto concurrent = pooled.handle_remediate_array(request.dump());

        ASSERT_EQ(concurrent.status, 200);
        EXPECT_EQ(json::parse(concurrent.body), json::parse(sequential.body));
        EXPECT_EQ(json::parse(concurrent.body).size(), 10u);
    }

    TEST_F(ScanApiTest, EmptyArrayReturnsEmptyArray) {
        const auto response = api.handle("POST", "/remediate-array", "[]");

        ASSERT_EQ(response.status, 200);
        EXPECT_EQ(json::parse(response.body), json::array());
    }

    TEST_F(ScanApiTest, MalformedJsonIsUnprocessable) {
        const auto response = api.handle("POST", "/remediate", "{not json");

        EXPECT_EQ(response.status, 422);
        EXPECT_TRUE(json::parse(response.body).contains("error"));
    }

    TEST_F(ScanApiTest, InvalidUnitReportsFieldPath) {
        auto bad = unit_json("B", "BREAK-POINT.");
        bad.erase("type");
        const json request = json::array({unit_json("A", ""), bad});

        const auto response = api.handle("POST", "/remediate-array", request.dump());

        ASSERT_EQ(response.status, 422);
        const auto body = json::parse(response.body);
        EXPECT_EQ(body["error"], "Missing required field");
        EXPECT_EQ(body["detail"], "[1].type");
    }

    TEST_F(ScanApiTest, ArrayEndpointRejectsObject) {
        const auto response = api.handle("POST", "/remediate-array", unit_json("A", "").dump());
        EXPECT_EQ(response.status, 422);
    }

    TEST_F(ScanApiTest, WrongMethodIsNotAllowed) {
        EXPECT_EQ(api.handle("GET", "/remediate", "").status, 405);
        EXPECT_EQ(api.handle("POST", "/health", "").status, 405);
        EXPECT_EQ(api.handle("DELETE", "/remediate-array", "").status, 405);
    }

    TEST_F(ScanApiTest, UnknownPathIsNotFound) {
        const auto response = api.handle("GET", "/metrics", "");

        EXPECT_EQ(response.status, 404);
        EXPECT_EQ(json::parse(response.body)["error"], "Not Found");
    }

    TEST_F(ScanApiTest, QueryStringIsIgnored) {
        EXPECT_EQ(api.handle("GET", "/health?full=1", "").status, 200);
    }

    TEST(StatusTextTest, KnownCodes) {
        EXPECT_STREQ(status_text(200), "OK");
        EXPECT_STREQ(status_text(413), "Payload Too Large");
        EXPECT_STREQ(status_text(422), "Unprocessable Entity");
        EXPECT_STREQ(status_text(599), "Unknown");
    }

}  // namespace ars::service
