//
// Created by gregorian-rayne on 10/11/26.
//

#include "ars/config/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace ars::config
{
    namespace fs = std::filesystem;

    class ConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir_ = fs::temp_directory_path() / "ars_config_test";
            fs::create_directories(temp_dir_);
        }

        void TearDown() override {
            fs::remove_all(temp_dir_);
        }

        fs::path write_file(const std::string& name, const std::string& content) const {
            const auto path = temp_dir_ / name;
            std::ofstream out(path);
            out << content;
            return path;
        }

        fs::path temp_dir_;
    };

    TEST_F(ConfigTest, Defaults) {
        const auto config = Config::default_config();

        EXPECT_EQ(config.server.host, "127.0.0.1");
        EXPECT_EQ(config.server.port, 8000);
        EXPECT_EQ(config.server.threads, 0);
        EXPECT_EQ(config.server.max_connections, 100);
        EXPECT_EQ(config.server.max_request_size, 10485760u);
        EXPECT_TRUE(config.scan.parallel);
        EXPECT_TRUE(config.scan.rules.empty());
        EXPECT_EQ(config.logging.level, LogLevel::INFO);
        EXPECT_FALSE(config.logging.verbose);
        EXPECT_TRUE(config.validate().is_ok());
    }

    TEST_F(ConfigTest, LoadFromString) {
        const auto result = Config::load_from_string(R"(
[server]
host = "0.0.0.0"
port = 9090
threads = 8
max_request_size = 2048

[scan]
parallel = false
threads = 2
rules = ["Rule304_BreakPointUsage"]

[logging]
level = "debug"
verbose = true
)");

        ASSERT_TRUE(result.is_ok()) << result.error();
        const auto& config = result.value();
        EXPECT_EQ(config.server.host, "0.0.0.0");
        EXPECT_EQ(config.server.port, 9090);
        EXPECT_EQ(config.server.threads, 8);
        EXPECT_EQ(config.server.max_request_size, 2048u);
        EXPECT_EQ(config.server.read_timeout_sec, 30);
        EXPECT_FALSE(config.scan.parallel);
        EXPECT_EQ(config.scan.threads, 2);
        ASSERT_EQ(config.scan.rules.size(), 1u);
        EXPECT_EQ(config.scan.rules[0], "Rule304_BreakPointUsage");
        EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
        EXPECT_TRUE(config.logging.verbose);
    }

    TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
        const auto result = Config::load_from_string("");
        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().server.port, 8000);
    }

    TEST_F(ConfigTest, SyntaxErrorIsConfigError) {
        const auto result = Config::load_from_string("[server\nport = ");

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, OutOfRangePortFailsValidation) {
        const auto result = Config::load_from_string("[server]\nport = 70000\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }

    TEST_F(ConfigTest, NonPositiveRequestSizeIsRejected) {
        const auto result = Config::load_from_string("[server]\nmax_request_size = 0\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "server.max_request_size");
    }

    TEST_F(ConfigTest, UnknownLogLevelIsRejected) {
        const auto result = Config::load_from_string("[logging]\nlevel = \"chatty\"\n");
        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().context().value(), "logging.level");
    }

    TEST_F(ConfigTest, ValidateCollectsProblems) {
        Config config;
        config.server.host.clear();
        config.scan.threads = -1;

        const auto result = config.validate();

        ASSERT_TRUE(result.is_err());
        EXPECT_NE(result.error().message().find("server.host"), std::string::npos);
        EXPECT_NE(result.error().message().find("scan.threads"), std::string::npos);
    }

    TEST_F(ConfigTest, LoadFromFile) {
        const auto path = write_file("ars.toml", "[server]\nport = 8181\n");
        const auto result = Config::load_from_file(path.string());

        ASSERT_TRUE(result.is_ok());
        EXPECT_EQ(result.value().server.port, 8181);
    }

    TEST_F(ConfigTest, MissingFileIsNotFound) {
        const auto result = Config::load_from_file((temp_dir_ / "absent.toml").string());

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST_F(ConfigTest, ToStringLoadsBack) {
        Config config;
        config.server.port = 8123;
        config.scan.rules = {"Rule303_SetExtendedCheck"};
        config.logging.level = LogLevel::WARN;

        const auto reloaded = Config::load_from_string(config.to_string());

        ASSERT_TRUE(reloaded.is_ok()) << reloaded.error();
        EXPECT_EQ(reloaded.value().server.port, 8123);
        EXPECT_EQ(reloaded.value().scan.rules, config.scan.rules);
        EXPECT_EQ(reloaded.value().logging.level, LogLevel::WARN);
    }

    TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
        EXPECT_EQ(log_level_from_string("debug").value(), LogLevel::DEBUG);
        EXPECT_EQ(log_level_from_string("Info").value(), LogLevel::INFO);
        EXPECT_EQ(log_level_from_string("WARNING").value(), LogLevel::WARN);
        EXPECT_EQ(log_level_from_string("error").value(), LogLevel::ERROR);
        EXPECT_TRUE(log_level_from_string("trace").is_err());
    }

    TEST(LogLevelTest, ToString) {
        EXPECT_EQ(to_string(LogLevel::DEBUG), "DEBUG");
        EXPECT_EQ(to_string(LogLevel::WARN), "WARN");
    }

}  // namespace ars::config
